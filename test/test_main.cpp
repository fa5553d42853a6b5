#include <gtest/gtest.h>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>

// Mirrors the console report into a plain log file
class FileTestListener : public ::testing::EmptyTestEventListener {
private:
    std::ofstream log_file_;
    std::chrono::steady_clock::time_point test_start_time_;

public:
    explicit FileTestListener(const std::string& filename) {
        log_file_.open(filename);
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif

        log_file_ << "========================================\n";
        log_file_ << "envstage Test Results\n";
        log_file_ << "Date: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "\n";
        log_file_ << "========================================\n\n";
    }

    void OnTestStart(const ::testing::TestInfo& /*test_info*/) override {
        test_start_time_ = std::chrono::steady_clock::now();
    }

    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - test_start_time_).count();

        log_file_ << (test_info.result()->Passed() ? "  [       OK ] " : "  [  FAILED  ] ")
                  << test_info.test_suite_name() << "." << test_info.name()
                  << " (" << duration << " ms)\n";

        for (int i = 0; i < test_info.result()->total_part_count(); ++i) {
            const auto& part = test_info.result()->GetTestPartResult(i);
            if (part.failed()) {
                log_file_ << "    " << (part.file_name() ? part.file_name() : "?") << ":"
                          << part.line_number() << "\n";
                log_file_ << "    " << part.summary() << "\n";
            }
        }
    }

    void OnTestProgramEnd(const ::testing::UnitTest& unit_test) override {
        log_file_ << "\nTotal tests: " << unit_test.total_test_count() << "\n";
        log_file_ << "Passed: " << unit_test.successful_test_count() << "\n";
        log_file_ << "Failed: " << unit_test.failed_test_count() << "\n";
        log_file_ << (unit_test.Passed() ? "\nALL TESTS PASSED!\n" : "\nSOME TESTS FAILED!\n");
    }
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::UnitTest::GetInstance()->listeners().Append(
        new FileTestListener("envstage_test_results.log"));
    return RUN_ALL_TESTS();
}
