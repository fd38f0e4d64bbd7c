#include <hjkl/configuration.hpp>
#include <hjkl/errors.hpp>
#include <hjkl/game.hpp>
#include <hjkl/log.hpp>
#include <hjkl/raster.hpp>

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

using namespace std;
using namespace hjkl;

static optional<uint64_t> parse_seed(string_view text)
{
    text = trim(text);
    if (text.empty()) {
        return {};
    }
    try {
        return boost::lexical_cast<uint64_t>(string(text));
    } catch (boost::bad_lexical_cast const&) {
        return {};
    }
}

// vi keys; anything else keeps the current heading
static optional<Direction> key_direction(char key)
{
    switch (key) {
    case 'h': return Direction::Left;
    case 'j': return Direction::Down;
    case 'k': return Direction::Up;
    case 'l': return Direction::Right;
    }
    return {};
}

static string frame(GameState const& game)
{
    Raster raster = rasterize(game);
    if (game.config().braille_friendly && raster.width() % 2 == 0 && raster.height() % 4 == 0) {
        return pack_to_glyphs(raster);
    }
    return to_ascii(raster);
}

int main(int argc, char **argv) {
    if (Configuration::init()) {
        cerr << "Created .hjkl in the current directory." << endl;
    }

    Configuration config(hjkl::span<string_view const>({"game.ini"}));
    GameConfig board;
    try {
        board = game_config(config);
    } catch (ConfigurationError const& e) {
        cerr << "game.ini: " << e.what() << endl;
        return 1;
    }

    int first_move = 1;
    optional<uint64_t> seed;
    if (argc > 1) {
        seed = parse_seed(argv[1]);
        if (seed) {
            first_move = 2;
        }
    }
    if (!seed) {
        seed = parse_seed(config[hjkl::span<string_view const>({"play", "seed"})]);
    }

    string moves;
    for (int i = first_move; i < argc; ++ i) {
        moves += argv[i];
    }
    if (moves.empty()) {
        moves = ".....";
    }

    optional<GameState> game;
    try {
        game = seed ? GameState::with_seed(board, *seed) : GameState::with_random_seed(board);
    } catch (ConfigurationError const& e) {
        cerr << "game.ini: " << e.what() << endl;
        return 1;
    }

    string width = to_string(board.width), height = to_string(board.height);
    string seed_str = seed ? to_string(*seed) : "random";
    Log::log(hjkl::span<StringViewPair const>({
        {"event", "start"},
        {"width", width},
        {"height", height},
        {"seed", seed_str},
        {"moves", moves},
    }));

    uint64_t tick = 0;
    for (char key : moves) {
        cout << "===============================" << endl;
        cout << frame(*game) << endl;

        if (auto dir = key_direction(key)) {
            game->queue_direction(*dir);
        }
        TickResult res = game->step();
        ++ tick;
        Log::tick(tick, res, game->head());

        cout << "===============================" << endl;
        cout << "tick " << tick << ": " << to_string(res.status)
             << " score " << res.score << (res.ate_food ? " (ate)" : "") << endl;

        if (res.status == GameStatus::Dead) {
            break;
        }
    }

    string score = to_string(game->score());
    Log::log(hjkl::span<StringViewPair const>({
        {"event", "end"},
        {"status", to_string(game->status())},
        {"score", score},
    }));

    return 0;
}
