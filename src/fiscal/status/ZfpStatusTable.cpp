#include "fiscal/status/StatusDecoder.hpp"

namespace fiscal::status {

    using types::StatusMessageType;

    const StatusBitTable &zfpStatusBits() {
        static const StatusBitTable table = {
            // Byte 0
            {"E202", "FM read only", StatusMessageType::Error},
            {"E104", "Power down in opened fiscal receipt", StatusMessageType::Error},
            {"E303", "Printer not ready - overheat", StatusMessageType::Error},
            {"E103", "Date and time are not set", StatusMessageType::Error},
            {"E103", "Date and time are wrong", StatusMessageType::Error},
            {"E104", "RAM reset", StatusMessageType::Error},
            {"E102", "Hardware clock error", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 1
            {"E301", "Printer not ready - no paper", StatusMessageType::Error},
            {"E403", "Reports registers overflow", StatusMessageType::Error},
            {std::nullopt, "Customer report is not zeroed", StatusMessageType::Info},
            {std::nullopt, "Daily report is not zeroed", StatusMessageType::Info},
            {std::nullopt, "Article report is not zeroed", StatusMessageType::Info},
            {std::nullopt, "Operator report is not zeroed", StatusMessageType::Info},
            {std::nullopt, "Non-printed copy", StatusMessageType::Info},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 2
            {std::nullopt, "Opened non-fiscal receipt", StatusMessageType::Info},
            {std::nullopt, "Opened fiscal receipt", StatusMessageType::Info},
            {std::nullopt, "Opened fiscal detailed receipt", StatusMessageType::Info},
            {std::nullopt, "Opened fiscal receipt with VAT", StatusMessageType::Info},
            {std::nullopt, "Opened invoice fiscal receipt", StatusMessageType::Info},
            {"W202", "SD card near full", StatusMessageType::Warning},
            {"E206", "SD card full", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 3
            {"E299", "No FM module", StatusMessageType::Error},
            {"E299", "FM error", StatusMessageType::Error},
            {"E201", "FM full", StatusMessageType::Error},
            {"W201", "FM near full", StatusMessageType::Warning},
            {std::nullopt, "Decimal point", StatusMessageType::Info},
            {std::nullopt, "FM fiscalized", StatusMessageType::Info},
            {std::nullopt, "FM produced", StatusMessageType::Info},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 4
            {std::nullopt, "Printer: automatic cutting", StatusMessageType::Info},
            {std::nullopt, "External display: transparent display", StatusMessageType::Info},
            {std::nullopt, "Speed is 9600", StatusMessageType::Info},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "Drawer: automatic opening", StatusMessageType::Info},
            {std::nullopt, "Customer logo included in the receipt", StatusMessageType::Info},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 5
            {"E599", "Wrong SIM card", StatusMessageType::Error},
            {"E599", "Blocking 3 days without mobile operator", StatusMessageType::Error},
            {"W599", "No task from NRA", StatusMessageType::Warning},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {"E599", "Wrong SD card", StatusMessageType::Error},
            {"E599", "Deregistered", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 6
            {"E599", "No SIM card", StatusMessageType::Error},
            {"E599", "No GPRS modem", StatusMessageType::Error},
            {"E599", "No mobile operator", StatusMessageType::Error},
            {"E599", "No GPRS service", StatusMessageType::Error},
            {"W301", "Near end of paper", StatusMessageType::Warning},
            {"W599", "Unsent data for 24 hours", StatusMessageType::Warning},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
        };
        return table;
    }

} // namespace fiscal::status
