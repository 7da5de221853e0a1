#pragma once

#include <exception>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ferry::client
{

    // Writes results to stdout, either as text lines or as one JSON record per line.
    class Printer
    {
    public:
        Printer(bool json, bool quiet) : json_(json), quiet_(quiet) {}

        bool json() const { return json_; }

        // Text mode only; dropped with --quiet.
        void message(std::string_view text) const;

        // JSON mode only.
        void record(const nlohmann::json &record) const;

        // Prints `text` or `record` depending on the mode.
        void result(std::string_view text, const nlohmann::json &record) const;

        // Non-fatal error: "ferry: <message>" on stderr, or an error record on stdout.
        void error(const std::exception &error) const;
        void error(const std::exception_ptr &error) const;

    private:
        bool json_;
        bool quiet_;
    };

    nlohmann::json error_record(const std::exception &error);

} // namespace ferry::client
