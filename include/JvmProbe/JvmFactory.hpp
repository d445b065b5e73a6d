// include/JvmProbe/JvmFactory.hpp
#ifndef JVMPROBE_JVM_FACTORY_HPP
#define JVMPROBE_JVM_FACTORY_HPP

#include <JvmProbe/Jvm.hpp>
#include <JvmProbe/SystemProperties.hpp>
#include <JvmProbe/Utils/OS.hpp>

#include <memory>

namespace JvmProbe {

    /**
     * Picks the vendor variant from the reported vendor string and builds the detected JVM.
     */
    class JvmFactory {
    public:
        // Uses Jvm::currentSystemProperties() and the host operating system
        static std::shared_ptr<const Jvm> create();

        static std::shared_ptr<const Jvm> create(const SystemProperties& props,
                                                 std::shared_ptr<const Utils::OperatingSystem> os = Utils::OperatingSystem::current());
    };

} // namespace JvmProbe

#endif //JVMPROBE_JVM_FACTORY_HPP
