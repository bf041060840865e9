/**
 * @file quota_report.cpp
 * @brief Print the current Language Server quota report
 *
 * Usage: lsquota_report [--text]
 *
 * Prints the report as JSON by default, or a readable summary with
 * --text. Exit status is 0 on success, 2 when the Language Server is not
 * running and 1 on any other failure.
 */

#include "quota_monitor.hpp"
#include "report_json.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

using namespace lsquota;

static std::string percent(const std::optional<double>& value) {
    if (!value) return "n/a";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << *value << "%";
    return ss.str();
}

static std::string countdown(long long ms) {
    if (ms <= 0) return "now";
    long long minutes = ms / 60000;
    std::ostringstream ss;
    if (minutes >= 60) ss << minutes / 60 << "h ";
    ss << minutes % 60 << "m";
    return ss.str();
}

static void print_credits(const char* title, const std::optional<CreditBlock>& block) {
    if (!block) return;
    std::cout << title << block->available << " / " << block->monthly
              << " (" << percent(block->remaining_percentage) << " left)" << std::endl;
}

static void print_text(const QuotaReport& report) {
    std::cout << "===========================================" << std::endl;
    std::cout << "  Language Server Quota" << std::endl;
    std::cout << "===========================================" << std::endl;
    std::cout << "User:   " << report.user_name << " <" << report.user_email << ">" << std::endl;
    std::cout << "Plan:   " << report.plan_name;
    if (!report.plan_tier.empty()) std::cout << " (" << report.plan_tier << ")";
    std::cout << std::endl;
    print_credits("Prompt: ", report.prompt_credits);
    print_credits("Flow:   ", report.flow_credits);
    std::cout << "===========================================" << std::endl << std::endl;

    for (const auto& pool : report.pools) {
        std::cout << (pool.is_exhausted ? "⛔ " : "📦 ") << pool.name
                  << "  remaining " << percent(pool.remaining_percentage)
                  << ", resets in " << countdown(pool.time_until_reset_ms) << std::endl;
        for (const auto& model : pool.models) {
            std::cout << "   - " << model.label << " [" << model.model_id << "]" << std::endl;
        }
    }
    std::cout << std::endl << report.models.size() << " models · "
              << report.pools.size() << " pools" << std::endl;
}

int main(int argc, char* argv[]) {
    bool text = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--text") == 0) {
            text = true;
        } else {
            std::cerr << "usage: " << argv[0] << " [--text]" << std::endl;
            return 64;
        }
    }

    Config config = Config::from_env();

    try {
        QuotaMonitor monitor(config);
        QuotaReport report = monitor.get_quota_report();

        if (text) {
            print_text(report);
        } else {
            std::cout << write_json(to_json(report), true) << std::endl;
        }
    } catch (const QuotaException& e) {
        if (text) {
            std::cerr << "❌ " << e.what() << std::endl;
        } else {
            std::cout << write_json(error_to_json(e), true) << std::endl;
        }
        return e.kind() == ErrorKind::NotFound ? 2 : 1;
    }

    return 0;
}
