#include <hjkl/game.hpp>
#include <hjkl/errors.hpp>

#include <boost/container_hash/hash.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include <algorithm>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>

size_t std::hash<hjkl::Point>::operator()(hjkl::Point const& p) const noexcept
{
    size_t seed = 0;
    boost::hash_combine(seed, p.x);
    boost::hash_combine(seed, p.y);
    return seed;
}

namespace hjkl {

std::pair<int, int> delta(Direction dir)
{
    switch (dir) {
    case Direction::Up:    return {0, -1};
    case Direction::Down:  return {0, 1};
    case Direction::Left:  return {-1, 0};
    case Direction::Right: return {1, 0};
    }
    throw std::logic_error("unknown direction");
}

bool is_opposite(Direction a, Direction b)
{
    return (a == Direction::Up && b == Direction::Down)
        || (a == Direction::Down && b == Direction::Up)
        || (a == Direction::Left && b == Direction::Right)
        || (a == Direction::Right && b == Direction::Left);
}

std::string_view to_string(GameStatus status)
{
    switch (status) {
    case GameStatus::Running: return "running";
    case GameStatus::Dead: return "dead";
    }
    throw std::logic_error("unknown game status");
}

GameState::GameState(GameConfig config, std::uint64_t seed)
: config_(std::move(config))
, rng_(seed)
{
    if (config_.width <= 0 || config_.height <= 0) {
        throw ConfigurationError(
            "board must be at least 1x1, got "
            + std::to_string(config_.width) + "x" + std::to_string(config_.height)
        );
    }
}

GameState GameState::with_seed(GameConfig config, std::uint64_t seed)
{
    GameState game(std::move(config), seed);
    game.reset();
    return game;
}

GameState GameState::with_random_seed(GameConfig config)
{
    std::random_device entropy;
    std::uint64_t seed = ((std::uint64_t)entropy() << 32) | entropy();
    return with_seed(std::move(config), seed);
}

GameState GameState::from_layout(GameConfig config, std::uint64_t seed, Layout layout)
{
    GameState game(std::move(config), seed);

    if (layout.snake.empty()) {
        throw ConfigurationError("layout has no snake");
    }
    std::unordered_set<Point> body;
    for (auto & segment : layout.snake) {
        if (game.out_of_bounds(segment)) {
            throw ConfigurationError(
                "snake segment (" + std::to_string(segment.x) + "," + std::to_string(segment.y) + ") is off the board"
            );
        }
        if (!body.insert(segment).second) {
            throw ConfigurationError(
                "snake overlaps itself at (" + std::to_string(segment.x) + "," + std::to_string(segment.y) + ")"
            );
        }
    }
    for (auto & food : layout.food) {
        if (game.out_of_bounds(food) || body.contains(food)) {
            throw ConfigurationError(
                "food at (" + std::to_string(food.x) + "," + std::to_string(food.y) + ") is off the board or on the snake"
            );
        }
        game.food_.insert(food);
    }

    for (size_t i = 1; i < layout.snake.size(); ++ i) {
        if (!game.adjacent(layout.snake[i - 1], layout.snake[i])) {
            throw ConfigurationError(
                "snake segments " + std::to_string(i - 1) + " and " + std::to_string(i) + " are not neighbours"
            );
        }
    }

    game.snake_ = std::move(layout.snake);
    game.direction_ = layout.direction;
    if (game.snake_.size() >= 2) {
        Point next = game.next_head();
        if (game.config_.wrap_edges) {
            next = game.wrapped(next);
        }
        if (next == game.snake_[1]) {
            throw ConfigurationError("layout heading points back into the snake");
        }
    }
    return game;
}

Point GameState::head() const
{
    if (snake_.empty()) {
        throw std::logic_error("snake has no segments");
    }
    return snake_.front();
}

Layout GameState::layout() const
{
    return {snake_, direction_, std::vector<Point>(food_.begin(), food_.end())};
}

void GameState::queue_direction(Direction dir)
{
    pending_direction_ = dir;
}

void GameState::reset()
{
    // the snake trails left from the center column
    size_t room = (size_t)(config_.width / 2) + 1;
    if (std::max<size_t>(config_.initial_len, 1) > room) {
        throw ConfigurationError(
            "initial length " + std::to_string(config_.initial_len)
            + " does not fit a board " + std::to_string(config_.width) + " wide"
        );
    }

    status_ = GameStatus::Running;
    score_ = 0;
    snake_.clear();
    food_.clear();
    direction_ = Direction::Right;
    pending_direction_.reset();

    int cx = config_.width / 2;
    int cy = config_.height / 2;
    int len = (int)std::max<size_t>(config_.initial_len, 1);
    for (int i = 0; i < len; ++ i) {
        snake_.push_back({cx - i, cy});
    }

    spawn_food();
}

TickResult GameState::step()
{
    if (status_ == GameStatus::Dead) {
        return result(false);
    }

    if (pending_direction_) {
        if (!is_opposite(*pending_direction_, direction_)) {
            direction_ = *pending_direction_;
        }
        pending_direction_.reset();
    }

    Point next = next_head();

    if (!config_.wrap_edges && out_of_bounds(next)) {
        status_ = GameStatus::Dead;
        return result(false);
    }
    if (config_.wrap_edges) {
        next = wrapped(next);
    }

    // the tail cell frees up this tick unless the snake grows
    bool eating = food_.contains(next);
    if (collides_with_body(next, !eating)) {
        return result(false);
    }

    snake_.push_front(next);

    if (eating) {
        food_.erase(next);
        ++ score_;
        spawn_food();
    } else {
        snake_.pop_back();
    }

    return result(eating);
}

Point GameState::next_head() const
{
    auto [dx, dy] = delta(direction_);
    Point h = head();
    return {h.x + dx, h.y + dy};
}

bool GameState::out_of_bounds(Point p) const
{
    return p.x < 0 || p.x >= config_.width || p.y < 0 || p.y >= config_.height;
}

Point GameState::wrapped(Point p) const
{
    if (p.x < 0) {
        p.x = config_.width - 1;
    } else if (p.x >= config_.width) {
        p.x = 0;
    }
    if (p.y < 0) {
        p.y = config_.height - 1;
    } else if (p.y >= config_.height) {
        p.y = 0;
    }
    return p;
}

bool GameState::adjacent(Point a, Point b) const
{
    int dx = std::abs(a.x - b.x);
    int dy = std::abs(a.y - b.y);
    if (config_.wrap_edges) {
        dx = std::min(dx, config_.width - dx);
        dy = std::min(dy, config_.height - dy);
    }
    return dx + dy == 1;
}

bool GameState::collides_with_body(Point p, bool tail_moves_off) const
{
    auto end = snake_.end();
    if (tail_moves_off && !snake_.empty()) {
        -- end;
    }
    return std::find(snake_.begin(), end, p) != end;
}

void GameState::spawn_food()
{
    // a full board must not loop forever
    size_t max_attempts = std::max<size_t>(2 * (size_t)config_.width * (size_t)config_.height, 8);
    std::unordered_set<Point> body(snake_.begin(), snake_.end());
    boost::random::uniform_int_distribution<int> xs(0, config_.width - 1);
    boost::random::uniform_int_distribution<int> ys(0, config_.height - 1);

    for (size_t attempt = 0; attempt < max_attempts; ++ attempt) {
        Point p;
        p.x = xs(rng_);
        p.y = ys(rng_);
        if (!body.contains(p) && !food_.contains(p)) {
            food_.insert(p);
            return;
        }
    }
}

TickResult GameState::result(bool ate_food) const
{
    return {ate_food, status_, score_};
}

} // namespace hjkl
