#pragma once
// =============================================================================
// UiTree - アクセシビリティ階層のインデックス化と検索
// =============================================================================
// エージェントの /source (JSON または XML) を ElementNode ツリーへ変換し、
// 前順深さ優先で 0 から番号を振ったフラットな一覧を作る。
// 番号はそのスナップショットでのみ有効（取得のたびに作り直す）。
//
// 検索は Predicate (フィールド AND 条件 + 任意の index) で行う:
//   index あり  -> 一致した要素の index 番目（範囲外は NoSuchElement）
//   index なし  -> 一致はちょうど1件であること（0件 NoSuchElement, 複数件 InvalidArgument）
// =============================================================================

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace simpilot::ui {

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int center_x() const { return x + width / 2; }
    int center_y() const { return y + height / 2; }
};

// ノード自身の属性（子を含まない）
struct ElementInfo {
    std::string type;        // "Button" (XCUIElementType 接頭辞は除去済み)
    std::string label;
    std::string value;
    std::string identifier;
    std::string text;        // placeholder / title
    bool enabled = true;
    bool visible = true;
    Rect frame;

    // identifier > label > value > text の順で最初の非空文字列
    std::string displayName() const;
};

struct ElementNode {
    ElementInfo info;
    std::vector<ElementNode> children;
};

struct IndexedElement {
    int index = 0;
    int depth = 0;
    int parent_index = -1;   // ルートは -1
    ElementInfo info;
};

enum class TreeFormat { Json, Xml };

// "XCUIElementTypeButton" -> "Button"
std::string normalizeType(const std::string& raw_type);

// WDA /source?format=json の value
Result<ElementNode> parseJsonTree(const nlohmann::json& root);

// WDA /source?format=xml の value（<AppiumAUT> ラッパー対応）
Result<ElementNode> parseXmlTree(const std::string& xml);

// =========================================================================
// Predicate
// =========================================================================

struct FieldRule {
    enum class Mode { Exact, Contains, StartsWith };
    std::string field;       // type, label, value, identifier, text, enabled, visible
    std::string pattern;
    Mode mode = Mode::Exact;
};

struct Predicate {
    std::vector<FieldRule> rules;
    std::optional<int> index;  // 一致集合の中での 0 始まり番号

    Predicate& where(std::string field, std::string pattern,
                     FieldRule::Mode mode = FieldRule::Mode::Exact) {
        rules.push_back({std::move(field), std::move(pattern), mode});
        return *this;
    }
    Predicate& nth(int n) { index = n; return *this; }

    bool matches(const ElementInfo& info) const;
};

// {"type":"Button","label":{"contains":"Log"},"index":1}
Result<Predicate> parsePredicate(const nlohmann::json& query);

// =========================================================================
// UiTreeIndex - 1 スナップショット分のフラット一覧
// =========================================================================

class UiTreeIndex {
public:
    UiTreeIndex() = default;

    static UiTreeIndex build(const ElementNode& root);

    const std::vector<IndexedElement>& elements() const { return elements_; }
    size_t size() const { return elements_.size(); }

    Result<IndexedElement> at(int index) const;

    // 条件に合う全要素（走査順）
    std::vector<IndexedElement> findAll(const Predicate& predicate) const;

    // index/曖昧さのルールを適用した単一要素
    Result<IndexedElement> find(const Predicate& predicate) const;

    // 1要素1行、深さ1につき空白2個: [3] Button "login"
    std::string render() const;

    nlohmann::json toJson() const;

private:
    std::vector<IndexedElement> elements_;
};

nlohmann::json elementToJson(const IndexedElement& element);

} // namespace simpilot::ui
