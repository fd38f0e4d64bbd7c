#include <hjkl/log.hpp>
#include <hjkl/configuration.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace hjkl {

static std::tm & launch_time()
{
    static struct LaunchTime : public std::tm
    {
        LaunchTime()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
            *(std::tm*)this = *std::gmtime(&now_time_t);
        }
    } launch_tm;
    return launch_tm;
}

// opened on first use, so the project directory only has to exist by then
static std::ofstream & logf()
{
    static struct LogStream : public std::ofstream
    {
        LogStream()
        {
            std::stringstream logfn_ss;
            logfn_ss << std::put_time(&launch_time(), "%FT%H%M%SZ.log");
            open(Configuration::path_local(hjkl::span<std::string_view const>({
                "logs",
                logfn_ss.str()
            })), std::ios::app);
        }
    } logf;
    return logf;
}

static void append(boost::json::object & obj)
{
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    obj["ts"] = now_ms / 1000.0;

    logf() << obj << std::endl;
}

void Log::log(std::span<StringViewPair const> fields)
{
    boost::json::object obj;
    for (auto&& [key, value] : fields) {
        obj[key] = value;
    }
    append(obj);
}

void Log::tick(std::uint64_t tick, TickResult const& result, Point head)
{
    boost::json::object obj;
    obj["event"] = "tick";
    obj["tick"] = tick;
    obj["ate_food"] = result.ate_food;
    obj["status"] = to_string(result.status);
    obj["score"] = result.score;
    obj["head"] = boost::json::array{head.x, head.y};
    append(obj);
}

static struct EnsureLaunchTimeCreated
{
    EnsureLaunchTimeCreated()
    { launch_time(); }
} ensure_launchtime_created;

} // namespace hjkl
