#pragma once

#include <boost/random/mersenne_twister.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace hjkl {

// Grid cell coordinate, y grows downward
struct Point {
    int x = 0;
    int y = 0;

    bool operator==(Point const&) const = default;
};

enum class Direction {
    Up,
    Down,
    Left,
    Right,
};

// Unit vector of one step in the given direction
std::pair<int, int> delta(Direction dir);

bool is_opposite(Direction a, Direction b);

enum class GameStatus {
    Running,
    Dead,
};

std::string_view to_string(GameStatus status);

struct GameConfig {
    int width = 40;
    int height = 24;
    bool wrap_edges = false;
    // Values below 1 are treated as 1
    std::size_t initial_len = 4;
    // Only a hint for renderers; the simulation ignores it
    bool braille_friendly = true;
};

struct TickResult {
    bool ate_food;
    GameStatus status;
    std::uint32_t score;

    bool operator==(TickResult const&) const = default;
};

} // namespace hjkl

namespace std {
template <>
struct hash<hjkl::Point> {
    size_t operator()(hjkl::Point const& p) const noexcept;
};
}

namespace hjkl {

/*
 * A board position: the snake head first, its heading and the food cells.
 */
struct Layout {
    std::deque<Point> snake;
    Direction direction = Direction::Right;
    std::vector<Point> food;
};

class GameState {
public:
    using FoodSet = std::unordered_set<Point>;

    /**
     * @brief Start a game whose food placement is fully determined by `seed`.
     *
     * The snake is centered on the board heading right, trailing to the left,
     * and one piece of food is spawned.
     *
     * @throws ConfigurationError if the board has no cells or the initial
     *         snake does not fit left of the center column.
     */
    static GameState with_seed(GameConfig config, std::uint64_t seed);

    /**
     * @brief Start a game seeded from the system's entropy source.
     */
    static GameState with_random_seed(GameConfig config);

    /**
     * @brief Start a game from an explicit position instead of the centered one.
     *
     * No food is spawned beyond what the layout lists.
     *
     * The config's initial_len is not checked here; it only matters once
     * reset() is called.
     *
     * @throws ConfigurationError if the layout does not fit the board, the
     *         snake is empty, overlaps itself or has a gap between segments,
     *         the heading points back into the segment behind the head, or
     *         food lies on the snake.
     */
    static GameState from_layout(GameConfig config, std::uint64_t seed, Layout layout);

    GameConfig const& config() const { return config_; }
    GameStatus status() const { return status_; }
    std::uint32_t score() const { return score_; }
    Direction direction() const { return direction_; }

    // Head first
    std::deque<Point> const& snake_segments() const { return snake_; }
    FoodSet const& food_positions() const { return food_; }
    Point head() const;

    Layout layout() const;

    /*
     * Request a heading for the next step, replacing any earlier request.
     * A reversal is dropped when the step applies it.
     */
    void queue_direction(Direction dir);

    /*
     * Back to the centered starting position. The random stream continues
     * where it was; it is not re-seeded.
     *
     * @throws ConfigurationError if the initial snake does not fit left of
     *         the center column. The state is left untouched.
     */
    void reset();

    /*
     * Advance one tick.
     */
    TickResult step();

private:
    GameState(GameConfig config, std::uint64_t seed);

    Point next_head() const;
    bool out_of_bounds(Point p) const;
    Point wrapped(Point p) const;
    bool adjacent(Point a, Point b) const;
    bool collides_with_body(Point p, bool tail_moves_off) const;
    void spawn_food();
    TickResult result(bool ate_food) const;

    GameConfig config_;
    std::deque<Point> snake_;
    Direction direction_ = Direction::Right;
    std::optional<Direction> pending_direction_;
    FoodSet food_;
    boost::random::mt19937_64 rng_;
    GameStatus status_ = GameStatus::Running;
    std::uint32_t score_ = 0;
};

} // namespace hjkl
