/**
 * Ferry - Persisted sessions that make multi-item cp/mirror runs resumable.
 *
 * A session is a header (<id>.json, rewritten atomically) and a data stream (<id>.data, one JSON record per
 * TransferItem, written once while populating). Progress is a cursor per target: the position of the last item
 * fully copied to that target.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry
{

    enum class CommandType
    {
        Copy,
        Mirror
    };

    std::string_view to_string(CommandType type) noexcept;

    // Throws ferry::Error(InvalidArgument) on an unknown name.
    CommandType command_type_from_string(std::string_view name);

    enum class SessionState
    {
        Created,
        Populating,
        Active,
        Completed,
        Cleared
    };

    std::string_view to_string(SessionState state) noexcept;

    SessionState session_state_from_string(std::string_view name);

    struct TransferItem
    {
        std::string source_url;
        std::string target_url;
        std::uint64_t size{};
        std::string content_hash;
        // Index into SessionHeader::cursors.
        std::size_t target{};

        bool operator==(const TransferItem &) const = default;
    };

    struct TargetCursor
    {
        std::string target;
        // Data-stream position of the last item fully copied to this target.
        std::optional<std::size_t> position;
        std::string last_copied;
    };

    struct SessionHeader
    {
        std::string id;
        std::string version{"1"};
        std::chrono::system_clock::time_point created_at{};
        std::string working_directory;
        CommandType command_type{CommandType::Copy};
        std::vector<std::string> command_args;
        SessionState state{SessionState::Created};
        bool force{};
        bool recursive{};
        // Source URL of the most recently completed item, across all targets.
        std::string last_copied;
        std::uint64_t total_bytes{};
        std::uint64_t total_objects{};
        std::uint64_t copied_bytes{};
        std::uint64_t copied_objects{};
        std::vector<TargetCursor> cursors;
    };

    class Session
    {
        // Only SessionStore can build one.
        class Key
        {
            friend class SessionStore;
            Key() = default;
        };

    public:
        Session(Key, std::filesystem::path dir, SessionHeader header);

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        SessionHeader header() const;

        const std::string &id() const { return id_; }

        std::filesystem::path header_path() const;
        std::filesystem::path data_path() const;

        // created -> populating. Opens the data stream for writing.
        void begin_populating();

        // Appends to the data stream and the totals. Only while populating.
        void append(const TransferItem &item);

        // populating -> active. Closes the data stream; it is read-only from here on.
        void activate();

        // The whole data stream in enumeration order. Position i is the i-th record.
        std::vector<TransferItem> items() const;

        bool is_copied(std::size_t position, std::size_t target) const;

        // Advances the item's target cursor to `position` and persists the header before returning.
        void mark_copied(std::size_t position, const TransferItem &item);

        // True when every target cursor has reached the last item that belongs to it.
        bool all_copied(const std::vector<TransferItem> &items) const;

        // active -> completed; removes both files.
        void complete();

        // Any state -> cleared; removes both files.
        void clear();

        // Writes the header to a temporary file and renames it over the previous one.
        void save() const;

    private:
        friend class SessionStore;

        void save_locked() const;
        void remove_files_locked();

        std::filesystem::path dir_;
        std::string id_;
        mutable std::mutex mutex_;
        SessionHeader header_;
        std::ofstream data_;
    };

    class SessionStore
    {
    public:
        static constexpr std::size_t kIdLength = 8;

        // A relative `dir` is anchored at the current directory, so sessions stay reachable after a chdir.
        explicit SessionStore(std::filesystem::path dir);

        const std::filesystem::path &dir() const { return dir_; }

        // Fills id, version, created_at and working_directory of the prototype and persists it in state `created`.
        std::unique_ptr<Session> create(SessionHeader prototype);

        // Throws SessionDirMissing or InvalidSessionId.
        std::unique_ptr<Session> load(const std::string &id) const;

        // Like load(), but only for sessions in state `active`.
        std::unique_ptr<Session> resume(const std::string &id) const;

        bool exists(const std::string &id) const;

        // Headers sorted by creation time. Unreadable headers are skipped.
        std::vector<SessionHeader> list() const;

        void clear(const std::string &id);

        // Returns how many sessions were cleared.
        std::size_t clear_all();

    private:
        std::filesystem::path dir_;
    };

} // namespace ferry
