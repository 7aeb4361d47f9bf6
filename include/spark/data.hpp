#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "resolvable.hpp"

namespace spark {

enum data_kind : int8_t {
	eScalar,
	eVector,
	eMatrix,
	eStruct,
	eArray,
};

enum scalar_kind : int8_t {
	eBool,
	eI32,
	eU32,
	eF32,
	__scalar_kind_end
};

// Shader data types; all sizes and alignments follow std430
struct DataType : Resolvable {
	virtual data_kind kind() const = 0;
	virtual uint64_t size() const = 0;
	virtual uint64_t alignment() const = 0;
	virtual bool same_as(const DataType &) const = 0;

	// Declarator for a variable of this type, e.g. "uint counts[64]"
	virtual std::string declare(ResolutionContext &, const std::string &);
};

using data_ref = std::shared_ptr <DataType>;

struct Scalar : DataType {
	scalar_kind scalar;

	Scalar(scalar_kind scalar_) : scalar(scalar_) {}

	data_kind kind() const override {
		return eScalar;
	}

	uint64_t size() const override {
		return 4;
	}

	uint64_t alignment() const override {
		return 4;
	}

	bool same_as(const DataType &) const override;

	std::string label() const override;
	std::string resolve(ResolutionContext &) override;
};

struct Vector : DataType {
	scalar_kind component;
	uint32_t count;

	Vector(scalar_kind component_, uint32_t count_) : component(component_), count(count_) {}

	data_kind kind() const override {
		return eVector;
	}

	uint64_t size() const override {
		return 4 * count;
	}

	uint64_t alignment() const override {
		return count == 2 ? 8 : 16;
	}

	bool same_as(const DataType &) const override;

	std::string label() const override;
	std::string resolve(ResolutionContext &) override;
};

// Square float matrices, stored as columns
struct Matrix : DataType {
	uint32_t order;

	Matrix(uint32_t order_) : order(order_) {}

	data_kind kind() const override {
		return eMatrix;
	}

	uint64_t size() const override {
		return order * alignment();
	}

	uint64_t alignment() const override {
		return order == 2 ? 8 : 16;
	}

	bool same_as(const DataType &) const override;

	std::string label() const override;
	std::string resolve(ResolutionContext &) override;
};

struct Struct : DataType {
	using field = std::pair <std::string, data_ref>;

	std::string name;
	std::vector <field> fields;

	Struct(const std::string &name_, const std::vector <field> &fields_)
			: name(name_), fields(fields_) {}

	data_kind kind() const override {
		return eStruct;
	}

	uint64_t size() const override;
	uint64_t alignment() const override;
	bool same_as(const DataType &) const override;

	std::vector <uint64_t> offsets() const;

	std::string label() const override {
		return name;
	}

	std::string resolve(ResolutionContext &) override;
};

// Fixed-size, homogeneous arrays
struct Array : DataType {
	data_ref element;
	uint32_t count;

	Array(const data_ref &element_, uint32_t count_) : element(element_), count(count_) {}

	data_kind kind() const override {
		return eArray;
	}

	uint64_t stride() const;

	uint64_t size() const override {
		return stride() * count;
	}

	uint64_t alignment() const override {
		return element->alignment();
	}

	bool same_as(const DataType &) const override;

	std::string label() const override;
	std::string resolve(ResolutionContext &) override;
	std::string declare(ResolutionContext &, const std::string &) override;
};

namespace data {

inline const data_ref boolean = std::make_shared <Scalar> (eBool);
inline const data_ref i32 = std::make_shared <Scalar> (eI32);
inline const data_ref u32 = std::make_shared <Scalar> (eU32);
inline const data_ref f32 = std::make_shared <Scalar> (eF32);

inline const data_ref vec2f = std::make_shared <Vector> (eF32, 2);
inline const data_ref vec3f = std::make_shared <Vector> (eF32, 3);
inline const data_ref vec4f = std::make_shared <Vector> (eF32, 4);

inline const data_ref vec2i = std::make_shared <Vector> (eI32, 2);
inline const data_ref vec3i = std::make_shared <Vector> (eI32, 3);
inline const data_ref vec4i = std::make_shared <Vector> (eI32, 4);

inline const data_ref vec2u = std::make_shared <Vector> (eU32, 2);
inline const data_ref vec3u = std::make_shared <Vector> (eU32, 3);
inline const data_ref vec4u = std::make_shared <Vector> (eU32, 4);

inline const data_ref mat2f = std::make_shared <Matrix> (2);
inline const data_ref mat3f = std::make_shared <Matrix> (3);
inline const data_ref mat4f = std::make_shared <Matrix> (4);

data_ref struct_of(const std::string &, const std::vector <Struct::field> &);
data_ref array_of(const data_ref &, uint32_t);

} // namespace data

} // namespace spark
