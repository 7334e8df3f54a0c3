#pragma once

// Failures raised while decoding, planning or editing a disk image.
// Each carries the context needed to correct the input, and what() is
// already a complete message.

// Malformed or truncated input, reported with the offending byte offset.
class format_error : public util::exception
{
public:
    template <typename ... Args>
    format_error(size_t offset_, Args&& ... args)
        : util::exception(std::forward<Args>(args)..., " at offset ", offset_), offset(offset_) {}

    size_t offset;
};

// A value that would produce an image the boot ROM silently mishandles.
class invariant_violation : public util::exception
{
public:
    invariant_violation(const std::string& field_, int64_t bound_, int64_t value_)
        : util::exception(field_, " is ", value_, ", limit is ", bound_), field(field_), bound(bound_), value(value_) {}

    std::string field;
    int64_t bound;
    int64_t value;
};

class geometry_error : public util::exception
{
public:
    template <typename ... Args>
    explicit geometry_error(Args&& ... args)
        : util::exception(std::forward<Args>(args)...) {}
};

class geometry_too_large : public geometry_error
{
public:
    geometry_too_large(int cyls, int heads, int sectors, int64_t limit)
        : geometry_error(cyls, '/', heads, '/', sectors, " geometry is ",
            static_cast<int64_t>(cyls) * heads * sectors, " sectors, must be below ", limit) {}
};

class volume_too_large : public geometry_error
{
public:
    volume_too_large(const std::string& name_, int64_t sectors_, int64_t limit)
        : geometry_error("volume '", name_, "' is ", sectors_, " sectors, limit is ", limit), name(name_), sectors(sectors_) {}

    std::string name;
    int64_t sectors;
};

class capacity_exceeded : public geometry_error
{
public:
    capacity_exceeded(const std::string& name_, int64_t end_sector, int64_t limit)
        : geometry_error("volume '", name_, "' ends at sector ", end_sector, ", beyond the limit of ", limit), name(name_) {}

    std::string name;
};

class volume_index_error : public util::exception
{
public:
    volume_index_error(int index_, int count_)
        : util::exception("volume ", index_, " does not exist (", count_, " volume", (count_ == 1) ? "" : "s", ")"),
        index(index_), count(count_) {}

    int index;
    int count;
};

// The edited volume no longer matches the layout the native label describes.
class geometry_mismatch : public util::exception
{
public:
    geometry_mismatch(const std::string& field_, int64_t expected_, int64_t found_)
        : util::exception("edited volume ", field_, " is ", found_, ", expected ", expected_),
        field(field_), expected(expected_), found(found_) {}

    std::string field;
    int64_t expected;
    int64_t found;
};

class volume_type_error : public util::exception
{
public:
    volume_type_error(int index_, int type_)
        : util::exception("volume ", index_, " is not an MS-DOS volume (type ", type_, ")"), index(index_), type(type_) {}

    int index;
    int type;
};
