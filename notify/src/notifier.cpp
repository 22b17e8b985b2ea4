#include "notifier.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace notify {

namespace {

    std::string envOr(const std::string& value, const char* env_name) {
        if (!value.empty()) return value;
        const char* env = std::getenv(env_name);
        return env ? std::string(env) : std::string();
    }

    std::string nowUtcString() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_utc{};
        gmtime_r(&now, &tm_utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_utc);
        return buffer;
    }

} // namespace

std::string describeTrade(const std::string& strategy_name, const core::TradeRecord& trade) {
    return fmt::format("[{}] {} {} {} at ${:.2f} on {}", strategy_name, core::actionToString(trade.action),
                       trade.quantity, trade.asset, trade.executed_price, core::utils::dateToString(trade.date));
}

MailjetNotifier::MailjetNotifier(std::string api_key, std::string api_secret,
                                 std::string sender_email, std::string endpoint)
    : api_key_(envOr(api_key, "MAILJET_API_KEY")),
      api_secret_(envOr(api_secret, "MAILJET_API_SECRET")),
      sender_email_(std::move(sender_email)),
      endpoint_(std::move(endpoint))
{
    enabled_ = !api_key_.empty() && !api_secret_.empty();
    if (!enabled_) {
        core::logging::getLogger()->warn("Mailjet API keys not found (MAILJET_API_KEY, MAILJET_API_SECRET). Notifications disabled.");
    }
}

nlohmann::json MailjetNotifier::buildPayload(const std::string& recipient,
                                             const std::vector<std::string>& decisions,
                                             const std::string& timestamp) const {
    std::string text = fmt::format("Investment Decisions for {}:\n\n", timestamp);
    std::string html = fmt::format("<h3>Investment Decisions - {}</h3><ul>", timestamp);
    for (size_t i = 0; i < decisions.size(); ++i) {
        if (i > 0) text += "\n";
        text += decisions[i];
        html += "<li>" + decisions[i] + "</li>";
    }
    html += "</ul><p>Please review and execute manually if approved.</p>";

    nlohmann::json message = {
        {"From", {{"Email", sender_email_}, {"Name", "Settlement Backtester"}}},
        {"To", nlohmann::json::array({{{"Email", recipient}, {"Name", "Investor"}}})},
        {"Subject", fmt::format("Investment Alert: {} Action(s) Required", decisions.size())},
        {"TextPart", text},
        {"HTMLPart", html},
        {"CustomID", "BacktesterDecision"}
    };
    return nlohmann::json{{"Messages", nlohmann::json::array({message})}};
}

bool MailjetNotifier::notifyDecisions(const std::string& recipient, const std::vector<std::string>& decisions) {
    auto logger = core::logging::getLogger();
    if (!enabled_) {
        logger->info("Skipping notification to {}: Mailjet not configured.", recipient);
        return false;
    }
    if (decisions.empty()) {
        logger->debug("No decisions to send to {}.", recipient);
        return true;
    }
    if (recipient.empty()) {
        logger->warn("No notification recipient configured.");
        return false;
    }

    std::string body = buildPayload(recipient, decisions, nowUtcString()).dump();
    cpr::Response response = cpr::Post(cpr::Url{endpoint_},
                                       cpr::Authentication{api_key_, api_secret_, cpr::AuthMode::BASIC},
                                       cpr::Header{{"Content-Type", "application/json"}},
                                       cpr::Body{body},
                                       cpr::Timeout{15000});

    if (response.error) {
        logger->error("Error sending notification to {}: CPR error {} - {}", recipient,
                      static_cast<int>(response.error.code), response.error.message);
        return false;
    }
    if (response.status_code != 200) {
        logger->error("Failed to send notification: Status Code={}, Body='{}'", response.status_code,
                      response.text.substr(0, 300));
        return false;
    }
    logger->info("Notification with {} decisions sent to {}", decisions.size(), recipient);
    return true;
}

} // namespace notify
