#pragma once

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "fiscal/protocol/Command.hpp"
#include "fiscal/transport/Channel.hpp"
#include "fiscal/types/Error.hpp"

namespace fiscal::test {

    /**
     * @brief Scripted device: records what the driver sends and answers with queued bodies.
     *
     * The state is shared so a test keeps access to it after the channel has been
     * moved into a driver.
     */
    class FakeChannel : public transport::Channel {
    public:
        struct State {
            std::vector<protocol::Command> sent;
            std::deque<std::string> responses;
            // standing answers by opcode, consulted before the queue
            std::map<uint8_t, std::string> byOpcode;
            // answered once the queue is empty; no answer at all means timeout
            std::string fallback;
            bool hasFallback = false;
            bool failSend = false;
            bool open = true;

            void respond(const std::string &body) {
                responses.push_back(body);
            }

            void respondTo(uint8_t opcode, const std::string &body) {
                byOpcode[opcode] = body;
            }

            void respondAlways(const std::string &body) {
                fallback = body;
                hasFallback = true;
            }

            std::vector<uint8_t> opcodes() const {
                std::vector<uint8_t> result;
                for (const auto &command: sent) result.push_back(command.opcode);
                return result;
            }
        };

        explicit FakeChannel(std::shared_ptr<State> state)
            : state_(std::move(state)) {
        }

        void send(const std::string &bytes) override {
            if (state_->failSend) {
                throw types::TransportException("Serial port write failed");
            }
            protocol::Command command;
            command.opcode = static_cast<uint8_t>(bytes.at(0));
            command.payload = bytes.substr(1);
            state_->sent.push_back(command);
        }

        std::string receive() override {
            if (!state_->sent.empty()) {
                auto it = state_->byOpcode.find(state_->sent.back().opcode);
                if (it != state_->byOpcode.end()) return it->second;
            }
            if (state_->responses.empty()) {
                if (state_->hasFallback) return state_->fallback;
                throw types::TimeoutException();
            }
            auto body = state_->responses.front();
            state_->responses.pop_front();
            return body;
        }

        bool isOpen() const override {
            return state_->open;
        }

    private:
        std::shared_ptr<State> state_;
    };

    // 7 status bytes followed by the payload
    inline std::string zfpBody(const std::string &payload, std::string statusBytes = std::string(7, '\0')) {
        return statusBytes + payload;
    }

    // payload, separator, 6 status bytes
    inline std::string islBody(const std::string &payload, std::string statusBytes = std::string(6, '\0')) {
        return payload + '\x04' + statusBytes;
    }

    inline std::string zfpStatusWithBit(size_t byte, int bit) {
        std::string status(7, '\0');
        status[byte] = static_cast<char>(1 << bit);
        return status;
    }

} // namespace fiscal::test
