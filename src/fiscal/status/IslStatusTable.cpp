#include "fiscal/status/StatusDecoder.hpp"

namespace fiscal::status {

    using types::StatusMessageType;

    const StatusBitTable &islStatusBits() {
        static const StatusBitTable table = {
            // Byte 0
            {"E401", "Incoming data has syntax error", StatusMessageType::Error},
            {"E402", "Code of incoming command is invalid", StatusMessageType::Error},
            {"E103", "The clock needs setting", StatusMessageType::Error},
            {std::nullopt, "Not connected a customer display", StatusMessageType::Info},
            {"E303", "Failure in printing mechanism", StatusMessageType::Error},
            {"E199", "General error", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 1
            {"E403", "During command some of the fields for the sums overflow", StatusMessageType::Error},
            {"E404", "Command cannot be performed in the current fiscal mode", StatusMessageType::Error},
            {"E104", "Operational memory was cleared", StatusMessageType::Error},
            {"E102", "Low battery (the clock is in reset state)", StatusMessageType::Error},
            {"E105", "RAM failure after switch ON", StatusMessageType::Error},
            {"E302", "Paper cover is open", StatusMessageType::Error},
            {"E599", "The internal terminal is not working", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 2
            {"E301", "No paper", StatusMessageType::Error},
            {"W301", "Not enough paper", StatusMessageType::Warning},
            {"E206", "End of KLEN (under 1MB free)", StatusMessageType::Error},
            {std::nullopt, "A fiscal receipt is opened", StatusMessageType::Info},
            {"W202", "Coming end of KLEN (10MB free)", StatusMessageType::Warning},
            {std::nullopt, "A non-fiscal receipt is opened", StatusMessageType::Info},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 3 carries the switch states, decoded separately
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 4
            {"E202", "Error during writing to the fiscal memory", StatusMessageType::Error},
            {std::nullopt, "EIK is entered", StatusMessageType::Info},
            {std::nullopt, "FM number has been set", StatusMessageType::Info},
            {"W201", "There is space for not more than 50 entries in the FM", StatusMessageType::Warning},
            {"E201", "Fiscal memory is fully engaged", StatusMessageType::Error},
            {"E299", "FM general error", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},

            // Byte 5
            {"E204", "The fiscal memory is in the read-only mode", StatusMessageType::Error},
            {std::nullopt, "The fiscal memory is formatted", StatusMessageType::Info},
            {"E202", "The last record in the fiscal memory is not successful", StatusMessageType::Error},
            {std::nullopt, "The printer is in a fiscal mode", StatusMessageType::Info},
            {std::nullopt, "Tax rates have been entered at least once", StatusMessageType::Info},
            {"E203", "Fiscal memory read error", StatusMessageType::Error},
            {std::nullopt, "", StatusMessageType::Reserved},
            {std::nullopt, "", StatusMessageType::Reserved},
        };
        return table;
    }

} // namespace fiscal::status
