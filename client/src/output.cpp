#include "ferry/client/output.hpp"

#include <iostream>
#include <string>

#include "ferry/error_codes.hpp"

namespace ferry::client
{

    nlohmann::json error_record(const std::exception &error)
    {
        const auto code = error_code_of(error);
        return nlohmann::json{
            {"status", "error"},
            {"error", {{"code", std::string(to_string(code))}, {"message", describe(error)}}},
        };
    }

    void Printer::message(std::string_view text) const
    {
        if (json_ || quiet_)
        {
            return;
        }
        std::cout << text << std::endl;
    }

    void Printer::record(const nlohmann::json &record) const
    {
        if (!json_)
        {
            return;
        }
        std::cout << record.dump() << std::endl;
    }

    void Printer::result(std::string_view text, const nlohmann::json &record) const
    {
        if (json_)
        {
            this->record(record);
        }
        else
        {
            message(text);
        }
    }

    void Printer::error(const std::exception &error) const
    {
        if (json_)
        {
            std::cout << error_record(error).dump() << std::endl;
        }
        else
        {
            std::cerr << "ferry: " << describe(error) << std::endl;
        }
    }

    void Printer::error(const std::exception_ptr &error) const
    {
        if (!error)
        {
            return;
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &ex)
        {
            this->error(ex);
        }
    }

} // namespace ferry::client
