#include <deltapdf/InputSource.hh>

#include <deltapdf/DIntC.hh>

#include <cstring>
#include <stdexcept>

void
InputSource::setLastOffset(dpdf_offset_t offset)
{
    last_offset = offset;
}

dpdf_offset_t
InputSource::getLastOffset() const
{
    return last_offset;
}

std::string
InputSource::read(size_t count, dpdf_offset_t at)
{
    if (at >= 0) {
        seek(at, SEEK_SET);
    }
    std::string result(count, '\0');
    result.resize(read(result.data(), count));
    return result;
}

std::string
InputSource::readLine(size_t max_line_length)
{
    // Return at most max_line_length characters from the next line. Lines are terminated by one or
    // more \r or \n characters. Consume the trailing newline characters but don't return them.
    // After this is called, the file will be positioned after a line terminator or at the end of
    // the file, and last_offset will point to position the file had when this method was called.

    dpdf_offset_t offset = tell();
    std::string buf(max_line_length, '\0');
    buf.resize(read(buf.data(), max_line_length));
    seek(offset, SEEK_SET);
    dpdf_offset_t eol = findAndSkipNextEOL();
    last_offset = offset;
    size_t line_length = DIntC::to_size(eol - offset);
    if (line_length < buf.size()) {
        buf.resize(line_length);
    }
    return buf;
}

bool
InputSource::findFirst(char const* start_chars, dpdf_offset_t offset, size_t len, Finder& finder)
{
    // Basic approach: search for the first character of start_chars starting from offset but not
    // going past len (if len != 0). Once the first character is found, see if it is the beginning
    // of a sequence of characters matching start_chars. If so, call finder.check() to do
    // caller-specific additional checks. If not, keep searching.

    char buf[1025];
    // To enable us to guarantee null-termination, save an extra byte so that buf[size] is valid
    // memory.
    size_t size = sizeof(buf) - 1;
    size_t start_len = strlen(start_chars);
    if (start_len < 1 || start_len > size) {
        throw std::logic_error(
            "InputSource::findSource called with too small or too large of a character sequence");
    }

    char* p = nullptr;
    dpdf_offset_t buf_offset = offset;
    size_t bytes_read = 0;

    // Guarantee that we return from this loop. Each time through, we either return, advance p, or
    // restart the loop with a condition that will cause return on the next pass. Eventually we
    // will either be out of range or hit EOF, either of which forces us to return.
    while (true) {
        // Do we need to read more data? If p points to buf[size], since start_len is always >= 1,
        // this overflow test will be correct for that case regardless of start_chars.
        if (!p || (p + start_len) > (buf + bytes_read)) {
            if (p) {
                buf_offset += (p - buf);
            }
            seek(buf_offset, SEEK_SET);
            // Read into buffer and zero out the rest of the buffer including buf[size].
            bytes_read = read(buf, size);
            if (bytes_read < start_len) {
                return false;
            }
            memset(buf + bytes_read, '\0', 1 + (size - bytes_read));
            p = buf;
        }

        // Search for the first character.
        if ((p = static_cast<char*>(
                 memchr(p, start_chars[0], bytes_read - DIntC::to_size(p - buf)))) != nullptr) {
            // Found first letter.
            if (len != 0) {
                // Make sure it's in range.
                size_t p_relative_offset = DIntC::to_size((p - buf) + (buf_offset - offset));
                if (p_relative_offset >= len) {
                    // out of range
                    return false;
                }
            }
            if ((p + start_len) > (buf + bytes_read)) {
                // If there are not enough bytes left in the file for start_chars, we will detect
                // this on the next pass as EOF and return.
                continue;
            }

            // See if p points to a sequence matching start_chars. We already checked above to make
            // sure we are not going to overrun memory.
            if (strncmp(p, start_chars, start_len) == 0) {
                // Call finder.check() with the input source positioned to the point of the match.
                seek(buf_offset + (p - buf), SEEK_SET);
                if (finder.check()) {
                    return true;
                }
            }
            // This occurrence of the first character wasn't a match. Skip over it and keep
            // searching.
            ++p;
        } else {
            // Trigger reading the next block
            p = buf + bytes_read;
        }
    }
    throw std::logic_error("InputSource after while (true)");
}

bool
InputSource::findLast(char const* start_chars, dpdf_offset_t offset, size_t len, Finder& finder)
{
    bool found = false;
    dpdf_offset_t after_found_offset = 0;
    dpdf_offset_t cur_offset = offset;
    size_t cur_len = len;
    while (findFirst(start_chars, cur_offset, cur_len, finder)) {
        found = true;
        after_found_offset = tell();
        cur_offset = after_found_offset;
        if (len != 0) {
            if (DIntC::to_size(cur_offset - offset) >= len) {
                break;
            }
            cur_len = len - DIntC::to_size(cur_offset - offset);
        }
    }
    if (found) {
        seek(after_found_offset, SEEK_SET);
    }
    return found;
}
