#pragma once
#include <pollswitch/Types.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pollswitch {

// Builds the polling rate command understood by the target firmware.
//
// Layout (65 bytes, everything not listed is zero):
//   [0] report id 0x00   [3] command 0x02   [4] sub-command 0x02
//   [5] parameter 0x01   [7] config flag 0x01   [8] rate code
class CommandEncoder {
public:
    static constexpr std::size_t REPORT_ID_OFFSET = 0;
    static constexpr std::size_t COMMAND_OFFSET = 3;
    static constexpr std::size_t SUBCOMMAND_OFFSET = 4;
    static constexpr std::size_t PARAMETER_OFFSET = 5;
    static constexpr std::size_t CONFIG_FLAG_OFFSET = 7;
    static constexpr std::size_t RATE_CODE_OFFSET = 8;

    // Throws UnsupportedRateError for rates outside the rate table.
    static Report encode(int rate);

    static const std::map<int, uint8_t>& rateTable();
    static bool isSupportedRate(int rate);
    static std::optional<uint8_t> rateCode(int rate);
    static std::vector<int> supportedRates();

    // Accepts only the exact decimal spelling of a supported rate.
    static std::optional<int> parseRate(const std::string& text);

    static std::string toHex(const Report& report, std::size_t count = 9);
};

}
