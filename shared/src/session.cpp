#include "ferry/session.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {
        constexpr auto kHeaderExtension = ".json";
        constexpr auto kDataExtension = ".data";
        constexpr auto kTempSuffix = ".tmp";

        constexpr std::array<std::string_view, 5> kStateNames = {"created", "populating", "active", "completed",
                                                                 "cleared"};

        nlohmann::json item_to_json(const TransferItem &item)
        {
            return {{"source", item.source_url},
                    {"target", item.target_url},
                    {"size", item.size},
                    {"md5", item.content_hash},
                    {"targetIndex", item.target}};
        }

        TransferItem item_from_json(const nlohmann::json &json)
        {
            TransferItem item;
            item.source_url = json.at("source").get<std::string>();
            item.target_url = json.at("target").get<std::string>();
            item.size = json.value("size", std::uint64_t{0});
            item.content_hash = json.value("md5", std::string{});
            item.target = json.value("targetIndex", std::size_t{0});
            return item;
        }

        nlohmann::json header_to_json(const SessionHeader &header)
        {
            nlohmann::json cursors = nlohmann::json::array();
            for (const auto &cursor : header.cursors)
            {
                cursors.push_back({{"target", cursor.target},
                                   {"position", cursor.position ? nlohmann::json(*cursor.position) : nlohmann::json()},
                                   {"lastCopied", cursor.last_copied}});
            }
            const auto created = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     header.created_at.time_since_epoch())
                                     .count();
            return {{"id", header.id},
                    {"version", header.version},
                    {"createdAt", created},
                    {"workingDirectory", header.working_directory},
                    {"commandType", std::string(to_string(header.command_type))},
                    {"commandArgs", header.command_args},
                    {"state", std::string(to_string(header.state))},
                    {"flags", {{"force", header.force}, {"recursive", header.recursive}}},
                    {"lastCopied", header.last_copied},
                    {"totalBytes", header.total_bytes},
                    {"totalObjects", header.total_objects},
                    {"copiedBytes", header.copied_bytes},
                    {"copiedObjects", header.copied_objects},
                    {"targets", cursors}};
        }

        SessionHeader header_from_json(const nlohmann::json &json)
        {
            SessionHeader header;
            header.id = json.at("id").get<std::string>();
            header.version = json.value("version", std::string{"1"});
            header.created_at = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(json.value("createdAt", std::int64_t{0})));
            header.working_directory = json.value("workingDirectory", std::string{});
            header.command_type = command_type_from_string(json.at("commandType").get<std::string>());
            header.command_args = json.value("commandArgs", std::vector<std::string>{});
            header.state = session_state_from_string(json.at("state").get<std::string>());
            const auto flags = json.value("flags", nlohmann::json::object());
            header.force = flags.value("force", false);
            header.recursive = flags.value("recursive", false);
            header.last_copied = json.value("lastCopied", std::string{});
            header.total_bytes = json.value("totalBytes", std::uint64_t{0});
            header.total_objects = json.value("totalObjects", std::uint64_t{0});
            header.copied_bytes = json.value("copiedBytes", std::uint64_t{0});
            header.copied_objects = json.value("copiedObjects", std::uint64_t{0});
            for (const auto &item : json.value("targets", nlohmann::json::array()))
            {
                TargetCursor cursor;
                cursor.target = item.value("target", std::string{});
                const auto position = item.find("position");
                if (position != item.end() && !position->is_null())
                {
                    cursor.position = position->get<std::size_t>();
                }
                cursor.last_copied = item.value("lastCopied", std::string{});
                header.cursors.push_back(std::move(cursor));
            }
            return header;
        }

        SessionHeader read_header(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw Error(ErrorCode::InvalidSessionId, "Unable to read session header " + path.string());
            }
            try
            {
                nlohmann::json json;
                in >> json;
                return header_from_json(json);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw Error(ErrorCode::InvalidSessionId, "Corrupt session header " + path.string() + ": " + ex.what());
            }
        }

        bool valid_id(std::string_view id)
        {
            return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c)
                                              { return std::isalnum(c) != 0; });
        }

    } // namespace

    std::string_view to_string(CommandType type) noexcept
    {
        return type == CommandType::Mirror ? "mirror" : "cp";
    }

    CommandType command_type_from_string(std::string_view name)
    {
        if (name == "cp")
        {
            return CommandType::Copy;
        }
        if (name == "mirror")
        {
            return CommandType::Mirror;
        }
        throw Error(ErrorCode::InvalidArgument, "Unknown session command '" + std::string(name) + "'");
    }

    std::string_view to_string(SessionState state) noexcept
    {
        return kStateNames[static_cast<std::size_t>(state)];
    }

    SessionState session_state_from_string(std::string_view name)
    {
        for (std::size_t i = 0; i < kStateNames.size(); ++i)
        {
            if (kStateNames[i] == name)
            {
                return static_cast<SessionState>(i);
            }
        }
        throw Error(ErrorCode::InvalidArgument, "Unknown session state '" + std::string(name) + "'");
    }

    Session::Session(Key, std::filesystem::path dir, SessionHeader header)
        : dir_(std::move(dir)), id_(header.id), header_(std::move(header))
    {
    }

    SessionHeader Session::header() const
    {
        std::lock_guard lock(mutex_);
        return header_;
    }

    std::filesystem::path Session::header_path() const
    {
        return dir_ / (id_ + kHeaderExtension);
    }

    std::filesystem::path Session::data_path() const
    {
        return dir_ / (id_ + kDataExtension);
    }

    void Session::begin_populating()
    {
        std::lock_guard lock(mutex_);
        if (header_.state != SessionState::Created)
        {
            throw Error(ErrorCode::InvalidArgument, "Session " + id_ + " is already " +
                                                        std::string(to_string(header_.state)));
        }
        data_.open(data_path(), std::ios::trunc);
        if (!data_.is_open())
        {
            throw Error(ErrorCode::IoError, "Unable to open " + data_path().string());
        }
        header_.state = SessionState::Populating;
        save_locked();
        spdlog::debug("Session {} populating", id_);
    }

    void Session::append(const TransferItem &item)
    {
        std::lock_guard lock(mutex_);
        if (header_.state != SessionState::Populating)
        {
            throw Error(ErrorCode::InvalidArgument, "Session " + id_ + " is not accepting items");
        }
        if (item.target >= header_.cursors.size())
        {
            throw Error(ErrorCode::InvalidArgument, "Item target index out of range: " + std::to_string(item.target));
        }
        data_ << item_to_json(item).dump() << '\n';
        if (!data_)
        {
            throw Error(ErrorCode::IoError, "Write failed on " + data_path().string());
        }
        header_.total_bytes += item.size;
        ++header_.total_objects;
    }

    void Session::activate()
    {
        std::lock_guard lock(mutex_);
        if (header_.state != SessionState::Populating)
        {
            throw Error(ErrorCode::InvalidArgument, "Session " + id_ + " was not populating");
        }
        data_.flush();
        data_.close();
        if (data_.fail())
        {
            throw Error(ErrorCode::IoError, "Unable to finish " + data_path().string());
        }
        header_.state = SessionState::Active;
        save_locked();
        spdlog::info("Session {} active with {} items ({} bytes)", id_, header_.total_objects, header_.total_bytes);
    }

    std::vector<TransferItem> Session::items() const
    {
        std::ifstream in(data_path());
        if (!in.is_open())
        {
            throw Error(ErrorCode::InvalidSessionId, "Missing data stream for session " + id_);
        }
        std::vector<TransferItem> items;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty())
            {
                continue;
            }
            try
            {
                items.push_back(item_from_json(nlohmann::json::parse(line)));
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw Error(ErrorCode::InvalidSessionId, "Corrupt data stream for session " + id_ + " at record " +
                                                             std::to_string(items.size()) + ": " + ex.what());
            }
        }
        return items;
    }

    bool Session::is_copied(std::size_t position, std::size_t target) const
    {
        std::lock_guard lock(mutex_);
        if (target >= header_.cursors.size())
        {
            return false;
        }
        const auto &cursor = header_.cursors[target].position;
        return cursor && position <= *cursor;
    }

    void Session::mark_copied(std::size_t position, const TransferItem &item)
    {
        std::lock_guard lock(mutex_);
        if (item.target >= header_.cursors.size())
        {
            throw Error(ErrorCode::InvalidArgument, "Item target index out of range: " + std::to_string(item.target));
        }
        auto &cursor = header_.cursors[item.target];
        if (cursor.position && position <= *cursor.position)
        {
            return;
        }
        cursor.position = position;
        cursor.last_copied = item.source_url;
        header_.last_copied = item.source_url;
        header_.copied_bytes += item.size;
        ++header_.copied_objects;
        save_locked();
    }

    bool Session::all_copied(const std::vector<TransferItem> &items) const
    {
        std::lock_guard lock(mutex_);
        for (std::size_t position = 0; position < items.size(); ++position)
        {
            const auto target = items[position].target;
            if (target >= header_.cursors.size())
            {
                return false;
            }
            const auto &cursor = header_.cursors[target].position;
            if (!cursor || position > *cursor)
            {
                return false;
            }
        }
        return true;
    }

    void Session::complete()
    {
        std::lock_guard lock(mutex_);
        header_.state = SessionState::Completed;
        remove_files_locked();
        spdlog::info("Session {} completed", id_);
    }

    void Session::clear()
    {
        std::lock_guard lock(mutex_);
        header_.state = SessionState::Cleared;
        remove_files_locked();
        spdlog::info("Session {} cleared", id_);
    }

    void Session::save() const
    {
        std::lock_guard lock(mutex_);
        save_locked();
    }

    void Session::save_locked() const
    {
        const auto target = header_path();
        auto temp = target;
        temp += kTempSuffix;
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::IoError, "Unable to write " + temp.string());
            }
            out << header_to_json(header_).dump(2);
            out.flush();
            if (!out)
            {
                throw Error(ErrorCode::IoError, "Write failed on " + temp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            throw Error(ErrorCode::IoError, "Unable to replace " + target.string() + ": " + ec.message());
        }
    }

    void Session::remove_files_locked()
    {
        if (data_.is_open())
        {
            data_.close();
        }
        std::error_code ec;
        std::filesystem::remove(header_path(), ec);
        if (ec)
        {
            throw Error(ErrorCode::IoError, "Unable to remove " + header_path().string() + ": " + ec.message());
        }
        std::filesystem::remove(data_path(), ec);
        if (ec)
        {
            throw Error(ErrorCode::IoError, "Unable to remove " + data_path().string() + ": " + ec.message());
        }
    }

    SessionStore::SessionStore(std::filesystem::path dir) : dir_(std::filesystem::absolute(dir)) {}

    std::unique_ptr<Session> SessionStore::create(SessionHeader prototype)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
        {
            throw Error(ErrorCode::SessionDirMissing,
                        "Unable to create session directory " + dir_.string() + ": " + ec.message());
        }

        do
        {
            prototype.id = crypto::random_id(kIdLength);
        } while (exists(prototype.id));

        prototype.version = "1";
        prototype.created_at = std::chrono::system_clock::now();
        prototype.working_directory = std::filesystem::current_path(ec).string();
        prototype.state = SessionState::Created;

        auto session = std::make_unique<Session>(Session::Key{}, dir_, std::move(prototype));
        session->save();
        spdlog::debug("Session {} created in {}", session->id(), dir_.string());
        return session;
    }

    std::unique_ptr<Session> SessionStore::load(const std::string &id) const
    {
        if (!std::filesystem::is_directory(dir_))
        {
            throw Error(ErrorCode::SessionDirMissing, "Session directory " + dir_.string() + " does not exist");
        }
        if (!valid_id(id) || !exists(id))
        {
            throw Error(ErrorCode::InvalidSessionId, "Session '" + id + "' not found");
        }
        auto header = read_header(dir_ / (id + kHeaderExtension));
        if (header.id != id)
        {
            throw Error(ErrorCode::InvalidSessionId, "Session header " + id + " names a different session");
        }
        return std::make_unique<Session>(Session::Key{}, dir_, std::move(header));
    }

    std::unique_ptr<Session> SessionStore::resume(const std::string &id) const
    {
        auto session = load(id);
        const auto state = session->header().state;
        if (state != SessionState::Active)
        {
            throw Error(ErrorCode::InvalidSessionId,
                        "Session '" + id + "' cannot be resumed in state " + std::string(to_string(state)));
        }
        return session;
    }

    bool SessionStore::exists(const std::string &id) const
    {
        std::error_code ec;
        return std::filesystem::exists(dir_ / (id + kHeaderExtension), ec);
    }

    std::vector<SessionHeader> SessionStore::list() const
    {
        std::vector<SessionHeader> headers;
        std::error_code ec;
        if (!std::filesystem::is_directory(dir_, ec))
        {
            return headers;
        }
        for (const auto &entry : std::filesystem::directory_iterator(dir_, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kHeaderExtension)
            {
                continue;
            }
            try
            {
                headers.push_back(read_header(entry.path()));
            }
            catch (const Error &ex)
            {
                spdlog::warn("Skipping session header {}: {}", entry.path().string(), ex.what());
            }
        }
        std::sort(headers.begin(), headers.end(), [](const SessionHeader &a, const SessionHeader &b)
                  { return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id; });
        return headers;
    }

    void SessionStore::clear(const std::string &id)
    {
        load(id)->clear();
    }

    std::size_t SessionStore::clear_all()
    {
        std::size_t cleared = 0;
        for (const auto &header : list())
        {
            clear(header.id);
            ++cleared;
        }
        return cleared;
    }

} // namespace ferry
