#include <gtest/gtest.h>
#include <sstream>

#include "acceptance/harness.h"

using stratum::tests::acceptance::CaseReport;

TEST(AcceptanceTest, AllCases) {
    const auto reports = stratum::tests::acceptance::run_suite();
    EXPECT_FALSE(reports.empty());
    for (const CaseReport& report : reports) {
        if (!report.success) {
            std::ostringstream error_msg;
            error_msg << "Acceptance case '" << report.name << "' failed:\n";
            for (const auto& message : report.messages) {
                error_msg << "  - " << message << '\n';
            }
            ADD_FAILURE() << error_msg.str();
        }
    }
}
