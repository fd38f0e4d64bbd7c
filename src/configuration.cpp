#include <hjkl/configuration.hpp>
#include <hjkl/errors.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace fs = std::filesystem;

// specialize ini_parser write_keys so as to use git-style spacing
namespace boost { namespace property_tree { namespace ini_parser {
namespace detail {
template <>
void write_keys<ptree>(std::basic_ostream<ptree::key_type::value_type> & stream, const ptree& pt, bool throw_on_children)
{
    typedef typename ptree::key_type::value_type Ch;
    for (typename ptree::const_iterator it = pt.begin(), end = pt.end();
         it != end; ++it)
    {
        if (!it->second.empty()) {
            if (throw_on_children) {
                BOOST_PROPERTY_TREE_THROW(ini_parser_error(
                    "ptree is too deep", "", 0));
            }
            continue;
        }
        if (throw_on_children) {
            // indent keys within a section
            stream << Ch('\t');
        }
        stream << it->first << " = "
            << it->second.template get_value<
                std::basic_string<Ch> >()
            << Ch('\n');
    }
}
}
} } }

namespace hjkl {

namespace {

using boost::property_tree::ptree;

fs::path config_dir_user()
{
    fs::path path;
    char const* xdg_config_home = getenv("XDG_CONFIG_HOME");
    if (xdg_config_home != nullptr && *xdg_config_home) {
        path = fs::path(xdg_config_home);
    } else {
        char const* home = getenv("HOME");
        if (home != nullptr && *home) {
            path = fs::path(home) / ".config";
        }
    }
    if (path.empty()) {
        throw std::runtime_error("Neither XDG_CONFIG_HOME nor HOME is set.");
    }
    return path / "hjkl";
}

fs::path path_helper(fs::path path, std::span<std::string_view const> subpaths, bool is_dir) {
    for (const auto& subpath : subpaths) {
        path /= subpath;
    }
    if (is_dir) {
        fs::create_directories(path);
        path /= "";
    } else {
        fs::create_directories(path.parent_path());
    }
    return path;
}

// [section "subsection"] is stored as a single ptree key
std::pair<std::string, std::string> split_locator(std::span<std::string_view const> locator)
{
    if (locator.size() == 2) {
        return {std::string(locator[0]), std::string(locator[1])};
    } else if (locator.size() == 3) {
        std::stringstream ss;
        ss << locator[0] << ' ' << std::quoted(locator[1]);
        return {ss.str(), std::string(locator[2])};
    }
    throw std::invalid_argument("configuration locator must be {section, key} or {section, subsection, key}");
}

ptree * find(ptree & pt, std::string const& section, std::string const& key)
{
    auto section_it = pt.find(section);
    if (section_it == pt.not_found()) {
        return nullptr;
    }
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.not_found()) {
        return nullptr;
    }
    return &key_it->second;
}

class ConfigurationImpl {
public:
    ConfigurationImpl(std::span<std::string_view const> subpath, bool user_wide)
    : path_(user_wide ? Configuration::path_user(subpath) : Configuration::path_local(subpath))
    {
        if (!user_wide) {
            auto path_user = Configuration::path_user(subpath);
            if (fs::exists(path_user)) {
                dflt_lock_.emplace(path_user.c_str());
                if (!dflt_lock_->try_lock_sharable()) {
                    std::cerr << "Waiting for another process to finish with " << path_user << " ..." << std::endl;
                    dflt_lock_->lock_sharable();
                }
                boost::property_tree::ini_parser::read_ini(path_user.string(), dflts_);
            }
        }
        if (fs::exists(path_)) {
            lock_.emplace(path_.c_str());
            if (!lock_->try_lock()) {
                std::cerr << "Waiting for another process to finish with " << path_ << " ..." << std::endl;
                lock_->lock();
            }
            boost::property_tree::ini_parser::read_ini(path_.string(), ptree_);
        }
    }

    ~ConfigurationImpl() {
        bool changed = false;
        for (auto & access : accessed_) {
            if (access.node->data() != access.original) {
                changed = true;
                break;
            }
        }
        if (!changed) {
            return;
        }
        // values only looked up, or filled in from defaults, are not persisted
        for (auto & access : accessed_) {
            if (access.created && access.node->data() == access.original) {
                auto & section = ptree_.find(access.section)->second;
                section.erase(access.key);
                if (section.empty() && section.data().empty()) {
                    ptree_.erase(access.section);
                }
            }
        }
        try {
            boost::property_tree::ini_parser::write_ini(path_.string(), ptree_);
        } catch (boost::property_tree::ini_parser_error const& e) {
            std::cerr << "Could not save " << path_ << ": " << e.what() << std::endl;
        }
    }

    std::string& operator[](std::span<std::string_view const> locator) {
        auto [section, key] = split_locator(locator);

        for (auto & access : accessed_) {
            if (access.section == section && access.key == key) {
                return access.node->data();
            }
        }

        ptree * value = find(ptree_, section, key);
        bool created = false;
        if (value == nullptr) {
            auto section_it = ptree_.find(section);
            ptree * section_pt = section_it == ptree_.not_found()
                ? &ptree_.push_back({section, ptree()})->second
                : &section_it->second;
            value = &section_pt->push_back({key, ptree()})->second;
            created = true;

            if (ptree * dflt = find(dflts_, section, key)) {
                value->data() = dflt->data();
            }
        }

        accessed_.push_back({section, key, value, value->data(), created});
        return value->data();
    }

private:
    struct Access {
        std::string section;
        std::string key;
        ptree * node;
        std::string original;
        bool created;
    };

    fs::path path_;
    ptree ptree_;
    std::optional<boost::interprocess::file_lock> lock_;
    ptree dflts_;
    std::optional<boost::interprocess::file_lock> dflt_lock_;
    std::vector<Access> accessed_;
};

template <typename T>
void parse_into(Configuration & config, std::string_view key, T & field)
{
    std::string_view text = trim(config[hjkl::span<std::string_view const>({"board", key})]);
    if (text.empty()) {
        return;
    }
    try {
        if constexpr (std::is_same_v<T, bool>) {
            if (boost::iequals(text, "true") || boost::iequals(text, "yes") || text == "1") {
                field = true;
            } else if (boost::iequals(text, "false") || boost::iequals(text, "no") || text == "0") {
                field = false;
            } else {
                throw boost::bad_lexical_cast();
            }
        } else {
            // lexical_cast wraps negative input for unsigned targets
            if (std::is_unsigned_v<T> && text.front() == '-') {
                throw boost::bad_lexical_cast();
            }
            field = boost::lexical_cast<T>(std::string(text));
        }
    } catch (boost::bad_lexical_cast const&) {
        throw ConfigurationError(
            "[board] " + std::string(key) + ": cannot read '" + std::string(text) + "'"
        );
    }
}

} // namespace

bool Configuration::init() {
    try {
        path_local();
    } catch (std::invalid_argument const& e) {
        fs::create_directory(".hjkl");
        return true;
    }
    return false;
}

Configuration::Configuration(std::span<std::string_view const> subpath, bool user_wide)
    : impl_(reinterpret_cast<void*>(new ConfigurationImpl(subpath, user_wide))) {}

Configuration::~Configuration() {
    delete reinterpret_cast<ConfigurationImpl*>(impl_);
}

std::string& Configuration::operator[](std::span<std::string_view const> locator) {
    return (*reinterpret_cast<ConfigurationImpl*>(impl_))[locator];
}

fs::path Configuration::path_local(std::span<std::string_view const> subpaths, bool is_dir) {
    fs::path config_dir_local;
    fs::path user_dir = config_dir_user();
    for (
        fs::path path = fs::current_path(), parent_path = path.parent_path();
        !path.empty();
        path = parent_path, parent_path = path.parent_path()
    ) {
        fs::path hjkl_dir = path / ".hjkl";
        if (hjkl_dir == user_dir) {
            break;
        }
        if (fs::is_directory(hjkl_dir)) {
            config_dir_local = hjkl_dir;
            break;
        }
        if (path == parent_path) {
            break;
        }
    }
    if (config_dir_local.empty()) {
        throw std::invalid_argument("Could not find .hjkl directory for project. Create one.");
    }
    return path_helper(config_dir_local, subpaths, is_dir);
}

fs::path Configuration::path_user(std::span<std::string_view const> subpaths, bool is_dir) {
    return path_helper(config_dir_user(), subpaths, is_dir);
}

GameConfig game_config(Configuration & config)
{
    GameConfig board;
    parse_into(config, "width", board.width);
    parse_into(config, "height", board.height);
    parse_into(config, "wrap_edges", board.wrap_edges);
    parse_into(config, "initial_len", board.initial_len);
    parse_into(config, "braille_friendly", board.braille_friendly);
    return board;
}

} // namespace hjkl
