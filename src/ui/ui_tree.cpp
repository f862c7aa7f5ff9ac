// =============================================================================
// UiTree - 階層解析・インデックス化・Predicate 検索
// =============================================================================

#include "ui/ui_tree.hpp"
#include "simpilot_log.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <limits>
#include <sstream>

static constexpr const char* TAG = "UiTree";

namespace simpilot::ui {

using json = nlohmann::json;

namespace {

constexpr int kMaxDepth = 512;
constexpr const char* kTypePrefix = "XCUIElementType";

const char* const kKnownFields[] = {
    "type", "label", "value", "identifier", "text", "enabled", "visible",
};

bool isKnownField(const std::string& field) {
    for (const char* f : kKnownFields) {
        if (field == f) return true;
    }
    return false;
}

// 文字列・数値・真偽値のいずれでも文字列化（value は数値で来ることがある）
std::string jsonText(const json& node, const char* key) {
    if (!node.contains(key)) return "";
    const auto& v = node[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number()) {
        std::ostringstream oss;
        oss << v.get<double>();
        return oss.str();
    }
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return "";
}

std::string firstText(const json& node, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        std::string s = jsonText(node, key);
        if (!s.empty()) return s;
    }
    return "";
}

bool parseFlag(const std::string& s, bool def) {
    if (s.empty()) return def;
    return s == "true" || s == "1" || s == "YES";
}

bool jsonFlag(const json& node, std::initializer_list<const char*> keys, bool def) {
    for (const char* key : keys) {
        if (!node.contains(key)) continue;
        const auto& v = node[key];
        if (v.is_boolean()) return v.get<bool>();
        if (v.is_number()) return v.get<double>() != 0.0;
        if (v.is_string()) return parseFlag(v.get<std::string>(), def);
    }
    return def;
}

int jsonInt(const json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_number()) return 0;
    return static_cast<int>(obj[key].get<double>());
}

// 形式: "{{x, y}, {w, h}}"
bool parseFrameString(const std::string& frame, Rect& out) {
    double x = 0, y = 0, w = 0, h = 0;
    if (std::sscanf(frame.c_str(), " {{%lf , %lf} , {%lf , %lf}}", &x, &y, &w, &h) != 4) {
        return false;
    }
    out = Rect{static_cast<int>(x), static_cast<int>(y), static_cast<int>(w), static_cast<int>(h)};
    return true;
}

Result<ElementNode> fromJsonNode(const json& node, int depth) {
    if (!node.is_object()) {
        return AutomationError(ErrorKind::UnknownAgentError, "hierarchy node is not an object", node);
    }
    if (depth > kMaxDepth) {
        return AutomationError(ErrorKind::UnknownAgentError, "hierarchy deeper than supported");
    }

    ElementNode out;
    ElementInfo& info = out.info;
    info.type = normalizeType(firstText(node, {"type", "elementType"}));
    info.label = jsonText(node, "label");
    info.value = jsonText(node, "value");
    info.identifier = firstText(node, {"identifier", "rawIdentifier", "name"});
    info.text = firstText(node, {"text", "placeholderValue", "title"});
    info.enabled = jsonFlag(node, {"isEnabled", "enabled"}, true);
    info.visible = jsonFlag(node, {"isVisible", "visible"}, true);

    if (node.contains("rect") && node["rect"].is_object()) {
        const auto& r = node["rect"];
        info.frame = Rect{jsonInt(r, "x"), jsonInt(r, "y"), jsonInt(r, "width"), jsonInt(r, "height")};
    } else if (node.contains("frame") && node["frame"].is_string()) {
        parseFrameString(node["frame"].get<std::string>(), info.frame);
    }

    if (node.contains("children") && node["children"].is_array()) {
        out.children.reserve(node["children"].size());
        for (const auto& child : node["children"]) {
            auto parsed = fromJsonNode(child, depth + 1);
            if (parsed.is_err()) return parsed.error();
            out.children.push_back(std::move(parsed).value());
        }
    }
    return out;
}

std::string xmlAttr(const tinyxml2::XMLElement* el, const char* name) {
    const char* v = el->Attribute(name);
    return v ? std::string(v) : std::string();
}

Result<ElementNode> fromXmlElement(const tinyxml2::XMLElement* el, int depth) {
    if (depth > kMaxDepth) {
        return AutomationError(ErrorKind::UnknownAgentError, "hierarchy deeper than supported");
    }

    ElementNode out;
    ElementInfo& info = out.info;
    std::string type = xmlAttr(el, "type");
    info.type = normalizeType(type.empty() ? el->Name() : type);
    info.label = xmlAttr(el, "label");
    info.value = xmlAttr(el, "value");
    info.identifier = xmlAttr(el, "name");
    if (info.identifier.empty()) info.identifier = xmlAttr(el, "identifier");
    info.text = xmlAttr(el, "placeholderValue");
    if (info.text.empty()) info.text = xmlAttr(el, "title");
    info.enabled = parseFlag(xmlAttr(el, "enabled"), true);
    info.visible = parseFlag(xmlAttr(el, "visible"), true);
    info.frame.x = el->IntAttribute("x", 0);
    info.frame.y = el->IntAttribute("y", 0);
    info.frame.width = el->IntAttribute("width", 0);
    info.frame.height = el->IntAttribute("height", 0);

    for (const auto* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
        auto parsed = fromXmlElement(child, depth + 1);
        if (parsed.is_err()) return parsed.error();
        out.children.push_back(std::move(parsed).value());
    }
    return out;
}

bool ruleMatches(const FieldRule& rule, const ElementInfo& info) {
    std::string actual;
    if (rule.field == "type") actual = info.type;
    else if (rule.field == "label") actual = info.label;
    else if (rule.field == "value") actual = info.value;
    else if (rule.field == "identifier") actual = info.identifier;
    else if (rule.field == "text") actual = info.text;
    else if (rule.field == "enabled") actual = info.enabled ? "true" : "false";
    else if (rule.field == "visible") actual = info.visible ? "true" : "false";
    else return false;

    switch (rule.mode) {
        case FieldRule::Mode::Exact:
            return actual == rule.pattern;
        case FieldRule::Mode::Contains:
            return actual.find(rule.pattern) != std::string::npos;
        case FieldRule::Mode::StartsWith:
            return actual.compare(0, rule.pattern.size(), rule.pattern) == 0;
    }
    return false;
}

} // namespace

// =============================================================================
// 要素属性
// =============================================================================

std::string ElementInfo::displayName() const {
    if (!identifier.empty()) return identifier;
    if (!label.empty()) return label;
    if (!value.empty()) return value;
    return text;
}

std::string normalizeType(const std::string& raw_type) {
    const size_t prefix_len = std::strlen(kTypePrefix);
    if (raw_type.size() > prefix_len && raw_type.compare(0, prefix_len, kTypePrefix) == 0) {
        return raw_type.substr(prefix_len);
    }
    return raw_type;
}

// =============================================================================
// 階層解析
// =============================================================================

Result<ElementNode> parseJsonTree(const json& root) {
    return fromJsonNode(root, 0);
}

Result<ElementNode> parseXmlTree(const std::string& xml) {
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError err = doc.Parse(xml.c_str(), xml.size());
    if (err != tinyxml2::XML_SUCCESS) {
        SPLOG_ERROR(TAG, "XML解析失敗: %s", doc.ErrorStr());
        return AutomationError(ErrorKind::UnknownAgentError,
                               std::string("malformed hierarchy XML: ") + doc.ErrorStr(),
                               xml.substr(0, 512));
    }

    const tinyxml2::XMLElement* root = doc.RootElement();
    if (!root) {
        return AutomationError(ErrorKind::UnknownAgentError, "hierarchy XML has no root element");
    }
    // <AppiumAUT> は type 属性を持たないラッパー
    if (!root->Attribute("type") && std::strcmp(root->Name(), "AppiumAUT") == 0) {
        root = root->FirstChildElement();
        if (!root) {
            return AutomationError(ErrorKind::UnknownAgentError, "empty AppiumAUT hierarchy");
        }
    }
    return fromXmlElement(root, 0);
}

// =============================================================================
// Predicate
// =============================================================================

bool Predicate::matches(const ElementInfo& info) const {
    return std::all_of(rules.begin(), rules.end(),
                       [&info](const FieldRule& rule) { return ruleMatches(rule, info); });
}

Result<Predicate> parsePredicate(const json& query) {
    if (!query.is_object()) {
        return AutomationError(ErrorKind::InvalidArgument, "predicate must be a JSON object");
    }

    Predicate predicate;
    for (auto it = query.begin(); it != query.end(); ++it) {
        const std::string& field = it.key();
        const json& rule = it.value();

        if (field == "index") {
            if (!rule.is_number_integer()) {
                return AutomationError(ErrorKind::InvalidArgument, "predicate index must be an integer");
            }
            if (rule.is_number_unsigned()
                    ? rule.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())
                    : (rule.get<long long>() < std::numeric_limits<int>::min() ||
                       rule.get<long long>() > std::numeric_limits<int>::max())) {
                return AutomationError(ErrorKind::InvalidArgument, "predicate index is out of range");
            }
            predicate.index = static_cast<int>(rule.get<long long>());
            continue;
        }
        if (!isKnownField(field)) {
            return AutomationError(ErrorKind::InvalidArgument, "unknown predicate field: " + field);
        }

        if (rule.is_string()) {
            predicate.where(field, rule.get<std::string>());
        } else if (rule.is_boolean()) {
            predicate.where(field, rule.get<bool>() ? "true" : "false");
        } else if (rule.is_object() && rule.size() == 1 && rule.begin()->is_string()) {
            const std::string mode = rule.begin().key();
            const std::string pattern = rule.begin()->get<std::string>();
            if (mode == "exact") {
                predicate.where(field, pattern, FieldRule::Mode::Exact);
            } else if (mode == "contains") {
                predicate.where(field, pattern, FieldRule::Mode::Contains);
            } else if (mode == "starts_with" || mode == "startsWith") {
                predicate.where(field, pattern, FieldRule::Mode::StartsWith);
            } else {
                return AutomationError(ErrorKind::InvalidArgument,
                                       "unknown match mode '" + mode + "' for " + field);
            }
        } else {
            return AutomationError(ErrorKind::InvalidArgument, "invalid rule for field " + field);
        }
    }
    return predicate;
}

// =============================================================================
// UiTreeIndex
// =============================================================================

UiTreeIndex UiTreeIndex::build(const ElementNode& root) {
    struct Frame {
        const ElementNode* node;
        int depth;
        int parent;
    };

    UiTreeIndex index;
    std::vector<Frame> stack;
    stack.push_back({&root, 0, -1});

    // 前順: 子は逆順に積んで文書順に取り出す
    while (!stack.empty()) {
        Frame f = stack.back();
        stack.pop_back();

        IndexedElement elem;
        elem.index = static_cast<int>(index.elements_.size());
        elem.depth = f.depth;
        elem.parent_index = f.parent;
        elem.info = f.node->info;
        index.elements_.push_back(std::move(elem));

        const int self = static_cast<int>(index.elements_.size()) - 1;
        for (auto it = f.node->children.rbegin(); it != f.node->children.rend(); ++it) {
            stack.push_back({&*it, f.depth + 1, self});
        }
    }

    SPLOG_DEBUG(TAG, "インデックス化: %zu 要素", index.elements_.size());
    return index;
}

Result<IndexedElement> UiTreeIndex::at(int index) const {
    if (index < 0 || index >= static_cast<int>(elements_.size())) {
        return AutomationError(ErrorKind::NoSuchElement,
                               "no element with index " + std::to_string(index) +
                               " (snapshot has " + std::to_string(elements_.size()) + ")");
    }
    return elements_[static_cast<size_t>(index)];
}

std::vector<IndexedElement> UiTreeIndex::findAll(const Predicate& predicate) const {
    std::vector<IndexedElement> out;
    for (const auto& elem : elements_) {
        if (predicate.matches(elem.info)) out.push_back(elem);
    }
    return out;
}

Result<IndexedElement> UiTreeIndex::find(const Predicate& predicate) const {
    auto matches = findAll(predicate);

    if (predicate.index) {
        const int n = *predicate.index;
        if (n < 0) {
            return AutomationError(ErrorKind::InvalidArgument,
                                   "predicate index must be >= 0, got " + std::to_string(n));
        }
        if (n >= static_cast<int>(matches.size())) {
            return AutomationError(ErrorKind::NoSuchElement,
                                   "predicate index " + std::to_string(n) + " out of range (" +
                                   std::to_string(matches.size()) + " matches)");
        }
        return matches[static_cast<size_t>(n)];
    }

    if (matches.empty()) {
        return AutomationError(ErrorKind::NoSuchElement, "no element matches predicate");
    }
    if (matches.size() > 1) {
        std::string candidates;
        const size_t shown = std::min<size_t>(matches.size(), 10);
        for (size_t i = 0; i < shown; ++i) {
            if (i) candidates += ", ";
            candidates += std::to_string(matches[i].index);
        }
        if (shown < matches.size()) candidates += ", ...";
        return AutomationError(ErrorKind::InvalidArgument,
                               std::to_string(matches.size()) +
                               " elements match predicate; add \"index\" or narrow it (candidates: " +
                               candidates + ")");
    }
    return matches.front();
}

std::string UiTreeIndex::render() const {
    std::string out;
    for (const auto& elem : elements_) {
        out.append(static_cast<size_t>(elem.depth) * 2, ' ');
        out += "[" + std::to_string(elem.index) + "] " +
               (elem.info.type.empty() ? std::string("Other") : elem.info.type);
        const std::string name = elem.info.displayName();
        if (!name.empty()) out += " \"" + name + "\"";
        out += "\n";
    }
    return out;
}

json elementToJson(const IndexedElement& element) {
    const auto& info = element.info;
    return json{
        {"index", element.index},
        {"depth", element.depth},
        {"parent_index", element.parent_index},
        {"type", info.type},
        {"label", info.label},
        {"value", info.value},
        {"identifier", info.identifier},
        {"text", info.text},
        {"enabled", info.enabled},
        {"visible", info.visible},
        {"frame", {{"x", info.frame.x}, {"y", info.frame.y},
                   {"width", info.frame.width}, {"height", info.frame.height}}},
        {"center", {{"x", info.frame.center_x()}, {"y", info.frame.center_y()}}},
    };
}

json UiTreeIndex::toJson() const {
    json arr = json::array();
    for (const auto& elem : elements_) arr.push_back(elementToJson(elem));
    return arr;
}

} // namespace simpilot::ui
