#include "gpu/device.hpp"

namespace spark::gpu {

const char *tbl_binding_type[] = {
	"uniform",
	"readonly-storage",
	"storage",
};

const char *tbl_texture_format[] = {
	"rgba8unorm",
	"bgra8unorm",
	"rgba16float",
	"rgba32float",
};

Device::Device()
{
	static uint64_t counter = 0;
	uid = counter++;
}

} // namespace spark::gpu
