#include <deltapdf/BufferInputSource.hh>

#include <deltapdf/DIntC.hh>

#include <algorithm>
#include <cstring>
#include <stdexcept>

BufferInputSource::BufferInputSource(
    std::string const& description, std::shared_ptr<std::string const> contents) :
    description(description),
    owned(contents),
    view(owned ? std::string_view(*owned) : std::string_view()),
    max_offset(DIntC::to_offset(view.size()))
{
}

BufferInputSource::BufferInputSource(std::string const& description, std::string_view contents) :
    description(description),
    view(contents),
    max_offset(DIntC::to_offset(view.size()))
{
}

BufferInputSource::~BufferInputSource() // NOLINT (modernize-use-equals-default)
{
    // Must be explicit and not inline -- see DELTAPDF_DLL_CLASS in DLL.h
}

dpdf_offset_t
BufferInputSource::findAndSkipNextEOL()
{
    if (cur_offset < 0) {
        throw std::logic_error("INTERNAL ERROR: BufferInputSource offset < 0");
    }
    dpdf_offset_t end_pos = max_offset;
    if (cur_offset >= end_pos) {
        last_offset = end_pos;
        cur_offset = end_pos;
        return end_pos;
    }

    dpdf_offset_t result = 0;
    char const* buffer = view.data();
    char const* end = buffer + end_pos;
    char const* p = buffer + cur_offset;

    while ((p < end) && !((*p == '\r') || (*p == '\n'))) {
        ++p;
    }
    if (p < end) {
        result = p - buffer;
        cur_offset = result + 1;
        ++p;
        while ((cur_offset < end_pos) && ((*p == '\r') || (*p == '\n'))) {
            ++p;
            ++cur_offset;
        }
    } else {
        cur_offset = end_pos;
        result = end_pos;
    }
    return result;
}

std::string const&
BufferInputSource::getName() const
{
    return description;
}

dpdf_offset_t
BufferInputSource::tell()
{
    return cur_offset;
}

void
BufferInputSource::seek(dpdf_offset_t offset, int whence)
{
    switch (whence) {
    case SEEK_SET:
        cur_offset = offset;
        break;

    case SEEK_END:
        DIntC::range_check(max_offset, offset);
        cur_offset = max_offset + offset;
        break;

    case SEEK_CUR:
        DIntC::range_check(cur_offset, offset);
        cur_offset += offset;
        break;

    default:
        throw std::logic_error("INTERNAL ERROR: invalid argument to BufferInputSource::seek");
        break;
    }

    if (cur_offset < 0) {
        throw std::runtime_error(description + ": seek before beginning of buffer");
    }
}

void
BufferInputSource::rewind()
{
    cur_offset = 0;
}

size_t
BufferInputSource::read(char* buffer, size_t length)
{
    if (cur_offset < 0) {
        throw std::logic_error("INTERNAL ERROR: BufferInputSource offset < 0");
    }
    dpdf_offset_t end_pos = max_offset;
    if (cur_offset >= end_pos) {
        last_offset = end_pos;
        return 0;
    }

    last_offset = cur_offset;
    size_t len = std::min(DIntC::to_size(end_pos - cur_offset), length);
    memcpy(buffer, view.data() + cur_offset, len);
    cur_offset += DIntC::to_offset(len);
    return len;
}

void
BufferInputSource::unreadCh(char)
{
    if (cur_offset > 0) {
        --cur_offset;
    }
}
