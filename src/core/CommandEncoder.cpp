#include "CommandEncoder.hpp"
#include <pollswitch/Errors.hpp>
#include <iomanip>
#include <sstream>

namespace pollswitch {

const std::map<int, uint8_t>& CommandEncoder::rateTable() {
    static const std::map<int, uint8_t> table = {
        {500, 2},
        {1000, 1},
        {2000, 32},
        {4000, 64},
        {8000, 128}
    };
    return table;
}

bool CommandEncoder::isSupportedRate(int rate) {
    return rateTable().count(rate) != 0;
}

std::optional<uint8_t> CommandEncoder::rateCode(int rate) {
    auto it = rateTable().find(rate);
    if (it == rateTable().end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<int> CommandEncoder::supportedRates() {
    std::vector<int> rates;
    rates.reserve(rateTable().size());
    for (const auto& [rate, _] : rateTable()) {
        rates.push_back(rate);
    }
    return rates;
}

std::optional<int> CommandEncoder::parseRate(const std::string& text) {
    for (const auto& [rate, _] : rateTable()) {
        if (text == std::to_string(rate)) {
            return rate;
        }
    }
    return std::nullopt;
}

Report CommandEncoder::encode(int rate) {
    auto code = rateCode(rate);
    if (!code) {
        throw UnsupportedRateError(rate);
    }

    Report report{};
    report[REPORT_ID_OFFSET] = 0x00;
    report[COMMAND_OFFSET] = 0x02;
    report[SUBCOMMAND_OFFSET] = 0x02;
    report[PARAMETER_OFFSET] = 0x01;
    report[CONFIG_FLAG_OFFSET] = 0x01;
    report[RATE_CODE_OFFSET] = *code;
    return report;
}

std::string CommandEncoder::toHex(const Report& report, std::size_t count) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (std::size_t i = 0; i < count && i < report.size(); ++i) {
        if (i) ss << ' ';
        ss << std::setw(2) << static_cast<int>(report[i]);
    }
    if (count < report.size()) {
        ss << " ...";
    }
    return ss.str();
}

}
