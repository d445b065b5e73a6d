// src/JvmFactory.cpp
#include <JvmProbe/JvmFactory.hpp>
#include <JvmProbe/Utils/Logger.hpp>

namespace JvmProbe {

std::shared_ptr<const Jvm> JvmFactory::create() {
    return create(Jvm::currentSystemProperties());
}

std::shared_ptr<const Jvm> JvmFactory::create(const SystemProperties& props,
                                              std::shared_ptr<const Utils::OperatingSystem> os) {
    static auto s_logger = Utils::Logger::GetOrCreateLogger("JvmFactory");

    const JvmVendor vendor = vendorFromString(props.javaVmVendor);
    s_logger->debug("Vendor '{}' selects the {} JVM variant", props.javaVmVendor, to_string(vendor));

    std::optional<JavaVersion> version;
    try {
        version = JavaVersion::parse(props.javaVersion);
    } catch (const std::invalid_argument& e) {
        s_logger->warn("{} Assuming a pre-Java 9 installation.", e.what());
        version = JavaVersion::parse("0");
    }

    return std::make_shared<const Jvm>(std::move(os), props.javaHome, *version, vendor, props.javaVmVendor);
}

} // namespace JvmProbe
