// tests/TestDirectory.hpp
#ifndef JVMPROBE_TEST_DIRECTORY_HPP
#define JVMPROBE_TEST_DIRECTORY_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <system_error>

namespace JvmProbe::Testing {

    // Temporary directory tree removed again on destruction
    class TestDirectory {
    public:
        TestDirectory() {
            static std::atomic<unsigned int> s_counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_root = std::filesystem::temp_directory_path()
                     / ("jvmprobe-test-" + std::to_string(stamp) + "-" + std::to_string(s_counter++));
            std::filesystem::create_directories(m_root);
            m_root = std::filesystem::canonical(m_root);
        }

        ~TestDirectory() {
            std::error_code ec;
            std::filesystem::remove_all(m_root, ec);
        }

        TestDirectory(const TestDirectory&) = delete;
        TestDirectory& operator=(const TestDirectory&) = delete;

        const std::filesystem::path& root() const { return m_root; }

        std::filesystem::path file(const std::string& relative) const {
            return (m_root / relative).lexically_normal();
        }

        std::filesystem::path createDir(const std::string& relative) const {
            std::filesystem::path dir = file(relative);
            std::filesystem::create_directories(dir);
            return dir;
        }

        std::filesystem::path createFile(const std::string& relative, const std::string& content = "") const {
            std::filesystem::path path = file(relative);
            std::filesystem::create_directories(path.parent_path());
            std::ofstream(path) << content;
            return path;
        }

        void createFiles(std::initializer_list<std::string> relatives) const {
            for (const auto& relative : relatives) {
                createFile(relative);
            }
        }

    private:
        std::filesystem::path m_root;
    };

} // namespace JvmProbe::Testing

#endif //JVMPROBE_TEST_DIRECTORY_HPP
