// SPDX-License-Identifier: BSD-3-Clause
#include "gridpilot/planners/motion_templates.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "gridpilot/core/logging.hpp"

namespace gridpilot::planners {

namespace {

const std::array<Vec2i, 8> kCompassDirections = {
    Vec2i( 0,  1),
    Vec2i( 1,  0),
    Vec2i( 0, -1),
    Vec2i(-1,  0),
    Vec2i( 1,  1),
    Vec2i( 1, -1),
    Vec2i(-1,  1),
    Vec2i(-1, -1),
};

}  // anonymous namespace

MotionTemplateCache::MotionTemplateCache(int max_increments, int arc)
    : max_increments_(max_increments), arc_(arc) {
    if (max_increments_ < 1) {
        throw std::invalid_argument("MotionTemplateCache: maxIncrements must be >= 1, got " +
                                    std::to_string(max_increments_));
    }
    if (arc_ < 0 || 2 * arc_ >= max_increments_) {
        throw std::invalid_argument("MotionTemplateCache: arc " + std::to_string(arc_) +
                                    " invalid for " + std::to_string(max_increments_) +
                                    " heading increments");
    }

    computeCardinalHeadings();

    templates_.reserve(static_cast<std::size_t>(max_increments_));
    for (HeadingIncrement h = 0; h < max_increments_; ++h) {
        templates_.push_back(generate(h));
    }

    log::get()->debug("Motion templates: {} headings, arc {}, {} moves", max_increments_, arc_,
                      size());
}

// ═════════════════════════════════════════════════════════════════════════════
// Cardinal headings
// ═════════════════════════════════════════════════════════════════════════════

void MotionTemplateCache::computeCardinalHeadings() {
    for (std::size_t d = 0; d < kCompassDirections.size(); ++d) {
        const Vec2 dir = kCompassDirections[d].cast<Scalar>();
        HeadingIncrement best = 0;
        Scalar best_dot = -constants::kInfinity;
        for (HeadingIncrement h = 0; h < max_increments_; ++h) {
            Scalar dot = headingDirection(h, max_increments_).dot(dir);
            if (dot > best_dot) {
                best_dot = dot;
                best = h;
            }
        }
        cardinal_[d] = best;
        log::get()->debug("  direction ({:2}, {:2}) -> heading {}",
                          kCompassDirections[d].x(), kCompassDirections[d].y(), best);
    }
}

bool MotionTemplateCache::isCardinal(HeadingIncrement heading) const noexcept {
    return std::find(cardinal_.begin(), cardinal_.end(), heading) != cardinal_.end();
}

// ═════════════════════════════════════════════════════════════════════════════
// Template generation
// ═════════════════════════════════════════════════════════════════════════════

MotionTemplate MotionTemplateCache::makeTemplate(HeadingIncrement target, bool reverse) const {
    Vec2 direction = headingDirection(target, max_increments_);
    if (reverse) direction = -direction;

    MotionTemplate t;
    t.offset = neighbourStep(direction);
    t.targetHeading = target;
    t.reverse = reverse;

    if (t.offset == Vec2i::Zero()) {
        throw std::logic_error("MotionTemplateCache: heading " + std::to_string(target) +
                               " produces a zero step (maxIncrements " +
                               std::to_string(max_increments_) + ", arc " +
                               std::to_string(arc_) + ")");
    }
    return t;
}

std::vector<MotionTemplate> MotionTemplateCache::generate(HeadingIncrement heading) const {
    std::vector<MotionTemplate> moves;
    moves.reserve(static_cast<std::size_t>(2 * arc_ + 1 + 4 * arc_ + 1));

    // Forward: turn by at most `arc`
    for (int i = -arc_; i <= arc_; ++i) {
        HeadingIncrement target = wrapHeading(heading + i, max_increments_);
        // Straight moves only along cardinal headings
        if (target == heading && !isCardinal(target)) continue;
        moves.push_back(makeTemplate(target, false));
    }

    // Reverse: turn by at most 2 * arc, stepping against the new heading
    const int reverse_arc = std::min(2 * arc_, max_increments_ / 2);
    for (int i = -reverse_arc; i <= reverse_arc; ++i) {
        HeadingIncrement target = wrapHeading(heading + i, max_increments_);
        auto t = makeTemplate(target, true);
        bool duplicate = std::any_of(moves.begin(), moves.end(), [&](const MotionTemplate& m) {
            return m.reverse && m.targetHeading == t.targetHeading;
        });
        if (!duplicate) moves.push_back(t);
    }
    return moves;
}

const std::vector<MotionTemplate>&
MotionTemplateCache::templatesFor(HeadingIncrement heading) const {
    if (!isValidHeading(heading, max_increments_)) {
        throw std::out_of_range("MotionTemplateCache: heading " + std::to_string(heading) +
                                " outside [0, " + std::to_string(max_increments_) + ")");
    }
    return templates_[static_cast<std::size_t>(heading)];
}

std::size_t MotionTemplateCache::size() const noexcept {
    std::size_t n = 0;
    for (const auto& t : templates_) n += t.size();
    return n;
}

}  // namespace gridpilot::planners
