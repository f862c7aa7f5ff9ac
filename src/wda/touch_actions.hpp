#pragma once
// =============================================================================
// SimPilot - W3C Pointer Action Sequences
// =============================================================================
// Element-free touch input expressed as pointerMove/pointerDown/pause/pointerUp
// steps, the primary gesture encoding for POST /session/{id}/actions.
// =============================================================================

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace simpilot::wda {

constexpr int kTapHoldMs = 100;
constexpr int kDoubleTapGapMs = 100;
constexpr int kLongPressDefaultMs = 1000;
constexpr int kSwipeDefaultMs = 500;

struct PointerStep {
    enum class Type { Move, Down, Pause, Up };
    Type type = Type::Pause;
    int x = 0;
    int y = 0;
    int duration_ms = 0;

    static PointerStep move(int x, int y, int duration_ms = 0) { return {Type::Move, x, y, duration_ms}; }
    static PointerStep down() { return {Type::Down, 0, 0, 0}; }
    static PointerStep pause(int duration_ms) { return {Type::Pause, 0, 0, duration_ms}; }
    static PointerStep up() { return {Type::Up, 0, 0, 0}; }

    bool operator==(const PointerStep& o) const {
        return type == o.type && x == o.x && y == o.y && duration_ms == o.duration_ms;
    }
};

struct PointerSequence {
    std::string id = "finger1";
    std::vector<PointerStep> steps;
};

PointerSequence tapSequence(int x, int y, int hold_ms = kTapHoldMs);
PointerSequence doubleTapSequence(int x, int y);
PointerSequence longPressSequence(int x, int y, int hold_ms = kLongPressDefaultMs);
PointerSequence swipeSequence(int from_x, int from_y, int to_x, int to_y,
                              int duration_ms = kSwipeDefaultMs);

// {"actions": [...]} body for the actions endpoint
nlohmann::json encodeActions(const std::vector<PointerSequence>& sequences);

// Inverse of encodeActions; rejects unknown step types
Result<std::vector<PointerSequence>> decodeActions(const nlohmann::json& body);

// Coordinates of the first pointerMove in a sequence
Result<std::pair<int, int>> firstPointerPosition(const PointerSequence& sequence);

} // namespace simpilot::wda
