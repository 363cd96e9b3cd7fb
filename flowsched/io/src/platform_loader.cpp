#include <flowsched/io/platform_loader.hpp>
#include <flowsched/io/error.hpp>

#include "json_access.hpp"

#include <flowsched/core/error.hpp>
#include <flowsched/core/platform.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace flowsched::io {

using namespace detail;

void load_platform(core::Engine& engine, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    load_platform_from_string(engine, oss.str());
}

void load_platform_from_string(core::Engine& engine, std::string_view json) {
    rapidjson::Document doc;
    parse_object(doc, json, "platform");

    auto& platform = engine.platform();
    const auto& resources = get_array(doc, "resources", "platform");
    if (resources.Empty()) {
        throw LoaderError("at least one resource is required", "platform");
    }

    for (rapidjson::SizeType idx = 0; idx < resources.Size(); ++idx) {
        const auto& obj = resources[idx];
        std::string ctx = "resources[" + std::to_string(idx) + "]";

        auto id = get_uint64(obj, "id", ctx);
        double mips = get_double(obj, "mips", ctx);
        if (mips <= 0.0) {
            throw LoaderError("mips must be positive", ctx);
        }
        auto cores = get_uint64_or(obj, "cores", 1, ctx);
        if (cores == 0 || cores > std::numeric_limits<uint32_t>::max()) {
            throw LoaderError("cores must be between 1 and 2^32-1", ctx);
        }
        auto ram_mb = get_uint64_or(obj, "ram_mb", 0, ctx);
        bool mobile = get_bool_or(obj, "mobile", false, ctx);

        try {
            platform.add_resource(id, mips, static_cast<uint32_t>(cores), ram_mb, mobile);
        } catch (const core::InvalidStateError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
}

} // namespace flowsched::io
