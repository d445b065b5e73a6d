// tests/FakeOperatingSystem.hpp
#ifndef JVMPROBE_FAKE_OPERATING_SYSTEM_HPP
#define JVMPROBE_FAKE_OPERATING_SYSTEM_HPP

#include <JvmProbe/Utils/OS.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace JvmProbe::Testing {

    // OperatingSystem with a fixed family and scripted PATH lookups
    class FakeOperatingSystem : public Utils::OperatingSystem {
    public:
        explicit FakeOperatingSystem(Utils::OSFamily family) : OperatingSystem(family, "") {}

        static std::shared_ptr<FakeOperatingSystem> windowsHost() {
            return std::make_shared<FakeOperatingSystem>(Utils::OSFamily::WINDOWS);
        }

        static std::shared_ptr<FakeOperatingSystem> linuxHost() {
            return std::make_shared<FakeOperatingSystem>(Utils::OSFamily::LINUX);
        }

        static std::shared_ptr<FakeOperatingSystem> macOsHost() {
            return std::make_shared<FakeOperatingSystem>(Utils::OSFamily::MACOS);
        }

        void onPath(const std::string& name, const std::filesystem::path& location) {
            m_onPath[name] = location;
        }

        std::optional<std::filesystem::path> findInPath(const std::string& name) const override {
            m_pathLookups.push_back(name);
            auto it = m_onPath.find(name);
            if (it == m_onPath.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        const std::vector<std::string>& pathLookups() const { return m_pathLookups; }

    private:
        std::map<std::string, std::filesystem::path> m_onPath;
        mutable std::vector<std::string> m_pathLookups;
    };

} // namespace JvmProbe::Testing

#endif //JVMPROBE_FAKE_OPERATING_SYSTEM_HPP
