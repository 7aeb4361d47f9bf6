#include "common/logging.hpp"
#include "spark/root.hpp"

namespace spark {

MODULE(root);

Root::Root(const std::shared_ptr <gpu::Device> &device_,
	   const Options &options_,
	   const std::shared_ptr <Transpiler> &transpiler_)
		: device(device_), options(options_), transpiler(transpiler_)
{
	SPARK_ASSERT(device != nullptr, "root created without a device");
}

buffer_ref Root::create_buffer(const data_ref &type, gpu::BufferUsageFlags flags, const std::string &label) const
{
	return std::make_shared <Buffer> (device, type, flags, label);
}

PipelineBuilder Root::pipeline() const
{
	return PipelineBuilder(device, transpiler, options);
}

PipelineBuilder Root::with(const slot_ref &s, const Value &value) const
{
	return pipeline().with(s, value);
}

void Root::submit() const
{
	device->submit();
}

} // namespace spark
