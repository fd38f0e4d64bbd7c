#pragma once

#include <hjkl/common.hpp>
#include <hjkl/game.hpp>

#include <cstdint>
#include <span>

namespace hjkl {

class Log {
public:
    /*
     * Append one JSON object line, with a "ts" field added, to the log file
     * for this launch under the project configuration directory.
     */
    static void log(std::span<StringViewPair const> fields);

    /*
     * Log the outcome of one step of a game as typed JSON values:
     * {"event":"tick","tick":n,"ate_food":b,"status":s,"score":n,"head":[x,y]}
     */
    static void tick(std::uint64_t tick, TickResult const& result, Point head);
};

} // namespace hjkl
