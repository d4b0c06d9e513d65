#pragma once

namespace walletcore::tests {

void test_telemetry_sink();
void test_log_writer();
void test_log_writer_reports_full_device();

}  // namespace walletcore::tests
