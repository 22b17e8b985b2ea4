#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace notify {

    // Delivers human-readable decision summaries. Implementations never throw:
    // a failed delivery is logged and reported through the return value.
    class INotifier {
    public:
        virtual ~INotifier() = default;

        virtual bool isEnabled() const = 0;
        virtual bool notifyDecisions(const std::string& recipient, const std::vector<std::string>& decisions) = 0;
    };

    // "[name] Buy 100 AAPL at $150.25 on 2024-01-05"
    std::string describeTrade(const std::string& strategy_name, const core::TradeRecord& trade);

    // Mailjet Send API v3.1 over HTTPS. Credentials come from the constructor or,
    // when empty, from MAILJET_API_KEY / MAILJET_API_SECRET. Without both the
    // notifier is disabled and every call is skipped with a log line.
    class MailjetNotifier : public INotifier {
    public:
        explicit MailjetNotifier(std::string api_key = "",
                                 std::string api_secret = "",
                                 std::string sender_email = "pilot@mailjet.com",
                                 std::string endpoint = "https://api.mailjet.com/v3.1/send");

        bool isEnabled() const override { return enabled_; }
        bool notifyDecisions(const std::string& recipient, const std::vector<std::string>& decisions) override;

        // Request body for one message, exposed for inspection
        nlohmann::json buildPayload(const std::string& recipient,
                                    const std::vector<std::string>& decisions,
                                    const std::string& timestamp) const;

    private:
        std::string api_key_;
        std::string api_secret_;
        std::string sender_email_;
        std::string endpoint_;
        bool enabled_ = false;
    };

} // namespace notify
