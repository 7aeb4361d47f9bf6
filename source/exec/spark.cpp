#include <algorithm>
#include <iostream>

#include <argparse/argparse.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "gpu/recording.hpp"
#include "spark.hpp"

#ifdef SPARK_VULKAN
#include "gpu/vulkan.hpp"
#endif

using namespace spark;

MODULE(spark);

// Counts how often every invocation ran, scaled by a uniform increment
static void run(Root &root, const glm::uvec3 &workgroups)
{
	static constexpr uint32_t local_size = 64;

	uint32_t invocations = workgroups.x * workgroups.y * workgroups.z * local_size;

	auto Params = data::struct_of("Params", {
		{ "increment", data::u32 },
	});

	auto counts = root.create_buffer(data::array_of(data::u32, invocations),
		gpu::BufferUsageFlags::storage, "counts");

	auto params = root.create_buffer(Params,
		gpu::BufferUsageFlags::uniform, "params");

	auto increment = slot("increment", uint32_t(1));

	auto step = fn({ data::u32 }, data::u32, R"(
		(uint value)
		{
			return value + increment;
		}
	)");

	step->named("step").uses({ { "increment", increment } });

	auto entry = compute_fn(glm::uvec3(local_size, 1, 1), R"(
		()
		{
			uint index = gl_LocalInvocationIndex
				+ gl_WorkGroupID.x * 64u
				+ gl_WorkGroupID.y * gl_NumWorkGroups.x * 64u
				+ gl_WorkGroupID.z * gl_NumWorkGroups.x * gl_NumWorkGroups.y * 64u;

			counts[index] = step(counts[index]) + params.increment;
		}
	)");

	entry->named("main").uses({
		{ "counts", as_mutable(counts) },
		{ "params", as_uniform(params) },
		{ "step", step },
	});

	params->write(std::vector <uint32_t> { 2 });

	auto pipeline = root.with(increment, uint32_t(3))
		.named("counter")
		.compute(entry);

	pipeline.dispatch(workgroups);
	root.submit();

	auto &memo = pipeline.unwrap();
	for (auto &source : memo.sources)
		io::display_lines("counter - Shader", source);

	if (memo.catchall) {
		SPARK_INFO("catch-all group #{} holds {} bindings",
			memo.catchall->index,
			memo.catchall->group->layout->entries.size());

		for (auto &[key, info] : memo.catchall->group->layout->entries)
			SPARK_INFO("  {}: {}", key, gpu::tbl_binding_type[int(binding_type(info.kind))]);
	}

	auto values = counts->read <uint32_t> ();
	values.resize(std::min <size_t> (values.size(), 8));
	SPARK_INFO("counts: {} ...", fmt::join(values, ", "));
}

int main(int argc, char *argv[])
{
	argparse::ArgumentParser program("spark");

	program.add_argument("--naming")
		.help("identifier naming strategy (strict or random)")
		.default_value(std::string("strict"));

	program.add_argument("--seed")
		.help("seed of the random naming strategy")
		.default_value(0)
		.scan <'i', int32_t> ();

	program.add_argument("--trace")
		.help("print every generated shader module")
		.default_value(false)
		.flag();

	program.add_argument("--quiet")
		.help("only report warnings and errors")
		.default_value(false)
		.flag();

	program.add_argument("--dump")
		.help("directory receiving every generated shader module");

	program.add_argument("--workgroups")
		.help("number of workgroups along each axis")
		.nargs(3)
		.default_value(std::vector <uint32_t> { 1, 1, 1 })
		.scan <'u', uint32_t> ();

	program.add_argument("--backend")
		.help("device backend (recording or vulkan)")
		.default_value(std::string("recording"));

	try {
		program.parse_args(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << e.what() << std::endl;
		std::cerr << program;
		return 1;
	}

	if (program["--quiet"] == true)
		io::set_threshold(io::eWarning);

	Options options;

	auto naming = program.get <std::string> ("--naming");
	if (naming == "random") {
		options.naming = NamingStrategy::random;
	} else if (naming != "strict") {
		SPARK_ERROR("unknown naming strategy \"{}\"", naming);
		return 1;
	}

	options.naming_seed = program.get <int32_t> ("--seed");
	options.trace = (program["--trace"] == true);

	if (auto dump = program.present("--dump"))
		options.trace_destination = *dump;

	auto axes = program.get <std::vector <uint32_t>> ("--workgroups");
	glm::uvec3 workgroups(axes[0], axes[1], axes[2]);

	std::shared_ptr <gpu::Device> device;

	auto backend = program.get <std::string> ("--backend");
	if (backend == "recording") {
		device = std::make_shared <gpu::RecordingDevice> ();
	} else if (backend == "vulkan") {
#ifdef SPARK_VULKAN
		device = std::make_shared <vulkan::Device> ();
#else
		SPARK_ERROR("spark was built without the vulkan backend");
		return 1;
#endif
	} else {
		SPARK_ERROR("unknown backend \"{}\"", backend);
		return 1;
	}

	Root root(device, options);

	try {
		run(root, workgroups);
	} catch (const Error &e) {
		SPARK_ERROR("{} ({})", e.what(), tbl_error_kind[e.kind]);
		return 1;
	}

	if (auto recording = std::dynamic_pointer_cast <gpu::RecordingDevice> (device)) {
		for (auto &line : recording->command_log())
			SPARK_NOTE("{}", line);
	}

	return 0;
}
