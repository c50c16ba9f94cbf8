#include "fiscal/driver/ProtocolDriver.hpp"

#include <cstdio>
#include <stdexcept>

#include "fiscal/types/Error.hpp"
#include "fiscal/utils/NumberFormatter.hpp"
#include "fiscal/utils/TextUtils.hpp"
#include "logger/Logger.hpp"

namespace fiscal::driver {

    namespace {
        std::string opcodeText(uint8_t opcode) {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02X", opcode);
            return hex;
        }
    }

    ProtocolDriver::ProtocolDriver(std::unique_ptr<transport::Channel> channel,
                                   std::unique_ptr<protocol::CommandCodec> codec,
                                   status::StatusDecoder decoder,
                                   DriverOptions options)
        : options_(std::move(options)),
          channel_(std::move(channel)),
          codec_(std::move(codec)),
          decoder_(std::move(decoder)) {
        if (!channel_) {
            throw std::invalid_argument("Channel cannot be null");
        }
        if (!codec_) {
            throw std::invalid_argument("CommandCodec cannot be null");
        }
        info_.itemTextMaxLength = static_cast<int>(codec_->limits().itemTextMaxLength);
        info_.commentTextMaxLength = static_cast<int>(codec_->limits().commentTextMaxLength);
    }

    void ProtocolDriver::setDeviceInfo(const model::DeviceInfo &info) {
        info_ = info;
        protocol::CodecLimits limits = codec_->limits();
        if (info.itemTextMaxLength > 0) limits.itemTextMaxLength = static_cast<size_t>(info.itemTextMaxLength);
        if (info.commentTextMaxLength > 0) limits.commentTextMaxLength = static_cast<size_t>(info.commentTextMaxLength);
        codec_->setLimits(limits);
    }

    DeviceResponse ProtocolDriver::request(const protocol::Command &command) {
        std::lock_guard<std::mutex> lock(requestMutex_);
        DeviceResponse response;
        try {
            channel_->send(codec_->encode(command));
            auto decoded = codec_->decode(channel_->receive());
            if (decoded.isError()) {
                Logger::logWarning("[" + name() + "] Malformed response to " + opcodeText(command.opcode) + ": " +
                                   decoded.error().message);
                response.status.addError(decoded.error());
                return response;
            }
            response.raw = decoded.value().payload;
            response.status = decoder_.decode(decoded.value().statusBytes);
        } catch (const types::TransportException &e) {
            Logger::logError("[" + name() + "] Transport failure on " + opcodeText(command.opcode) + ": " + e.what());
            response.status.addError(types::codes::TransportFailure, e.what());
            return response;
        }

        if (!response.status.ok()) {
            Logger::logWarning("[" + name() + "] Device reported errors for " + opcodeText(command.opcode));
        }
        return response;
    }

    DeviceResponse ProtocolDriver::request(const types::Result<protocol::Command> &command) {
        if (command.isError()) {
            Logger::logWarning("[" + name() + "] Command not sent: " + command.error().message);
            DeviceResponse response;
            response.status.addError(command.error());
            return response;
        }
        return request(command.value());
    }

    std::string ProtocolDriver::resolveOperator(const std::string &operatorId) const {
        return operatorId.empty() ? options_.operatorId : operatorId;
    }

    std::string ProtocolDriver::resolvePassword(const std::string &operatorPassword) const {
        return operatorPassword.empty() ? options_.operatorPassword : operatorPassword;
    }

    types::DeviceStatus ProtocolDriver::getStatus() {
        return request(codec_->getStatus()).status;
    }

    std::pair<std::optional<utils::DateTime>, types::DeviceStatus> ProtocolDriver::getDateTime() {
        auto response = request(codec_->getDateTime());
        if (!response.status.ok()) {
            response.status.addInfo("Error occurred while reading current date and time");
            return {std::nullopt, response.status};
        }

        auto dateTime = utils::parseDateTime(utils::trim(response.raw), codec_->dateTimeResponseFormat());
        if (!dateTime) {
            response.status.addInfo("Error occurred while parsing current date and time");
            response.status.addError(types::codes::WrongFormat, "Wrong format of date and time");
            return {std::nullopt, response.status};
        }
        return {dateTime, response.status};
    }

    types::DeviceStatus ProtocolDriver::setDateTime(const utils::DateTime &dateTime) {
        return request(codec_->setDateTime(dateTime)).status;
    }

    DeviceResponse ProtocolDriver::openReceipt(const std::string &uniqueSaleNumber,
                                               const std::string &operatorId,
                                               const std::string &operatorPassword) {
        return request(codec_->openReceipt(uniqueSaleNumber, resolveOperator(operatorId),
                                           resolvePassword(operatorPassword)));
    }

    DeviceResponse ProtocolDriver::openReversalReceipt(model::ReversalReason reason,
                                                       const std::string &receiptNumber,
                                                       const utils::DateTime &receiptDateTime,
                                                       const std::string &fiscalMemorySerialNumber,
                                                       const std::string &uniqueSaleNumber,
                                                       const std::string &operatorId,
                                                       const std::string &operatorPassword) {
        return request(codec_->openReversalReceipt(reason, receiptNumber, receiptDateTime, fiscalMemorySerialNumber,
                                                   uniqueSaleNumber, resolveOperator(operatorId),
                                                   resolvePassword(operatorPassword)));
    }

    DeviceResponse ProtocolDriver::addItem(int department,
                                           const std::string &text,
                                           double unitPrice,
                                           model::TaxGroup taxGroup,
                                           double quantity,
                                           double priceModifierValue,
                                           model::PriceModifierType priceModifierType) {
        return request(codec_->addItem(department, text, unitPrice, taxGroup, quantity,
                                       priceModifierValue, priceModifierType));
    }

    DeviceResponse ProtocolDriver::addComment(const std::string &text) {
        return request(codec_->addComment(text));
    }

    DeviceResponse ProtocolDriver::addPayment(double amount, model::PaymentType paymentType) {
        return request(codec_->addPayment(amount, paymentType));
    }

    DeviceResponse ProtocolDriver::subtotalChangeAmount(double amount) {
        return request(codec_->subtotalChangeAmount(amount));
    }

    DeviceResponse ProtocolDriver::closeReceipt() {
        return request(codec_->closeReceipt());
    }

    DeviceResponse ProtocolDriver::abortReceipt() {
        return request(codec_->abortReceipt());
    }

    DeviceResponse ProtocolDriver::fullPaymentAndCloseReceipt() {
        DeviceResponse response;
        for (const auto &command: codec_->fullPaymentAndCloseReceipt()) {
            response = request(command);
            if (!response.status.ok()) break;
        }
        return response;
    }

    DeviceResponse ProtocolDriver::printDailyReport(bool zeroing) {
        return request(codec_->printDailyReport(zeroing));
    }

    DeviceResponse ProtocolDriver::printReportForDate(const utils::DateTime &startDate,
                                                      const utils::DateTime &endDate,
                                                      model::ReportType type) {
        return request(codec_->printReportForDate(startDate, endDate, type));
    }

    DeviceResponse ProtocolDriver::moneyTransfer(double amount,
                                                 const std::string &operatorId,
                                                 const std::string &operatorPassword) {
        return request(codec_->moneyTransfer(amount, resolveOperator(operatorId), resolvePassword(operatorPassword)));
    }

    DeviceResponse ProtocolDriver::printDuplicate() {
        return request(codec_->printDuplicate());
    }

    std::pair<model::ReceiptInfo, types::DeviceStatus> ProtocolDriver::readLastReceiptInfo() {
        auto response = request(codec_->lastReceiptQrCode());
        if (!response.status.ok()) {
            response.status.addInfo("Error occurred while reading last receipt QR code data");
            return {model::ReceiptInfo{}, response.status};
        }
        return parseReceiptQrCode(utils::trim(response.raw), response.status);
    }

    std::pair<std::string, types::DeviceStatus> ProtocolDriver::getTaxIdentificationNumber() {
        auto response = request(codec_->taxIdentificationNumber());
        if (!response.status.ok()) {
            return {"", response.status};
        }
        auto fields = codec_->splitFields(response.raw);
        if (fields.size() < 2) {
            return {"", response.status};
        }
        return {utils::trim(fields.front()), response.status};
    }

    void ProtocolDriver::setPaymentTypeOverrides(const std::map<model::PaymentType, std::string> &overrides) {
        codec_->setPaymentTypeOverrides(overrides);
        if (!overrides.empty()) {
            Logger::logInfo("[" + name() + "] Applied " + std::to_string(overrides.size()) +
                            " payment type override(s) for " + info_.serialNumber);
        }
    }

    std::pair<std::optional<double>, types::DeviceStatus> ProtocolDriver::parseCashAmount(
        const DeviceResponse &response, size_t index, size_t minFields) const {
        types::DeviceStatus status = response.status;
        if (!status.ok()) {
            status.addInfo("Error occurred while reading cash amount");
            return {std::nullopt, status};
        }

        auto fields = codec_->splitFields(response.raw);
        if (fields.size() < minFields || fields.size() <= index) {
            status.addInfo("Error occurred while reading cash amount");
            status.addError(types::codes::WrongFormat, "Invalid format");
            return {std::nullopt, status};
        }

        auto amountText = utils::trim(fields[index]);
        auto amount = utils::parseAmount(amountText);
        if (!amount) {
            status.addInfo("Error occurred while reading cash amount");
            status.addError(types::codes::WrongFormat, "Invalid format");
            return {std::nullopt, status};
        }
        if (amountText.find('.') == std::string::npos) {
            *amount /= 100.0;
        }
        return {amount, status};
    }

    std::pair<model::ReceiptInfo, types::DeviceStatus> parseReceiptQrCode(const std::string &qrCodeData,
                                                                          types::DeviceStatus status) {
        auto fields = utils::split(qrCodeData, '*');
        if (fields.size() < 5) {
            status.addInfo("Error occurred while parsing last receipt QR code data");
            status.addError(types::codes::WrongFormat, "Wrong number of fields");
            return {model::ReceiptInfo{}, status};
        }

        auto amount = utils::parseAmount(fields[4]);
        if (!amount) {
            status.addInfo("Error occurred while parsing last receipt QR code data (receipt amount)");
            status.addError(types::codes::WrongFormat, "Wrong format of receipt amount");
            return {model::ReceiptInfo{}, status};
        }

        auto dateTime = utils::parseDateTime(utils::trim(fields[2]) + " " + utils::trim(fields[3]),
                                             utils::formats::Qr);
        if (!dateTime) {
            status.addInfo("Error occurred while parsing last receipt QR code data (receipt date and time)");
            status.addError(types::codes::WrongFormat, "Wrong format of receipt date and time");
            return {model::ReceiptInfo{}, status};
        }

        auto receiptNumber = utils::trim(fields[1]);
        if (receiptNumber.empty()) {
            status.addInfo("Error occurred while reading last receipt number");
            status.addError(types::codes::WrongFormat, "Last receipt number is empty");
            return {model::ReceiptInfo{}, status};
        }

        model::ReceiptInfo info;
        info.fiscalMemorySerialNumber = utils::trim(fields[0]);
        info.receiptNumber = receiptNumber;
        info.receiptDateTime = *dateTime;
        info.receiptAmount = *amount;
        return {info, status};
    }

} // namespace fiscal::driver
