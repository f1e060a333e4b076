#include <deltapdf/DPDFParser.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFObject_private.hh>
#include <deltapdf/DUtil.hh>

#include <limits>
#include <stdexcept>

using tt = DPDFTokenizer::token_type_e;

namespace
{
    class EndstreamFinder final: public InputSource::Finder
    {
      public:
        ~EndstreamFinder() final = default;
        bool
        check() final
        {
            // Any occurrence of the keyword ends the data.
            return true;
        }
    };
} // namespace

DPDFObjectHandle
DPDFParser::parse()
{
    auto object = parseValue();
    if (object.isDictionary()) {
        auto pos = input_.tell();
        auto token = tokenizer_.readToken(input_, object_description_, true);
        if (token.isWord("stream")) {
            readStream(object);
        } else {
            input_.seek(pos, SEEK_SET);
        }
    }
    return object;
}

DPDFObjectHandle
DPDFParser::parseIndirect(DPDFObjGen og)
{
    DPDFTokenizer::Token header[3];
    for (auto& t: header) {
        t = tokenizer_.readToken(input_, object_description_, true);
        if (t.getType() == tt::tt_eof) {
            throw error(dpdf_e_unexpected_eof, t.getOffset(), "EOF while reading object header");
        }
    }
    if (!(header[0].isInteger() && header[1].isInteger() && header[2].isWord("obj"))) {
        dpdf_offset_t offset = header[0].getOffset();
        throw error(dpdf_e_unexpected_token, offset, "expected n n obj");
    }
    auto objid = toInteger(header[0]);
    auto generation = toInteger(header[1]);
    if (objid < 1 || generation < 0 || objid > std::numeric_limits<int>::max() ||
        generation > std::numeric_limits<int>::max()) {
        throw error(
            dpdf_e_invalid_object,
            header[0].getOffset(),
            "invalid object id " + header[0].getValue() + " " + header[1].getValue());
    }
    og_ = DPDFObjGen(DIntC::to_int(objid), DIntC::to_int(generation));
    if (og.isIndirect() && og != og_) {
        throw error(
            dpdf_e_invalid_object,
            header[0].getOffset(),
            "expected " + og.unparse(' ') + " obj but found " + og_.unparse(' ') + " obj");
    }

    auto object = parse();

    auto token = tokenizer_.readToken(input_, object_description_, true);
    if (!token.isWord("endobj")) {
        auto e = token.getType() == tt::tt_eof
            ? error(dpdf_e_unexpected_eof, token.getOffset(), "expected endobj but found EOF")
            : error(
                  dpdf_e_unexpected_token,
                  token.getOffset(),
                  "expected endobj but found " + token.getRawValue());
        if (context_ && context_->attemptRecovery()) {
            warn(e);
            input_.seek(token.getOffset(), SEEK_SET);
        } else {
            throw e;
        }
    }
    object.setObjGen(og_);
    return object;
}

DPDFObjectHandle
DPDFParser::parseValue()
{
    stack_.clear();
    int_count_ = 0;

    while (true) {
        auto token = tokenizer_.readToken(input_, object_description_);
        dpdf_offset_t offset = token.getOffset();
        auto type = token.getType();

        if (int_count_ > 0) {
            if (type == tt::tt_integer && int_count_ == 1) {
                int_buffer_[1] = toInteger(token);
                int_offset_[1] = offset;
                int_count_ = 2;
                continue;
            }
            if (type == tt::tt_word && int_count_ == 2 && token.getValue() == "R") {
                int_count_ = 0;
                if (int_buffer_[0] < 1 || int_buffer_[1] < 0 ||
                    int_buffer_[0] > std::numeric_limits<int>::max() ||
                    int_buffer_[1] > std::numeric_limits<int>::max()) {
                    throw error(
                        dpdf_e_invalid_object,
                        int_offset_[0],
                        "invalid indirect reference " + std::to_string(int_buffer_[0]) + " " +
                            std::to_string(int_buffer_[1]) + " R");
                }
                auto ref = DPDFObjectHandle::newReference(
                    DIntC::to_int(int_buffer_[0]), DIntC::to_int(int_buffer_[1]));
                if (add(ref, int_offset_[0])) {
                    return ref;
                }
                continue;
            }
            if (stack_.empty()) {
                // A top-level integer is complete. Leave the input at the first token that is not
                // part of it.
                input_.seek(int_count_ == 2 ? int_offset_[1] : offset, SEEK_SET);
                int_count_ = 0;
                return DPDFObjectHandle::newInteger(int_buffer_[0]);
            }
            if (type == tt::tt_integer) {
                // int_count_ == 2: the first integer can no longer start a reference.
                add(DPDFObjectHandle::newInteger(int_buffer_[0]), int_offset_[0]);
                int_buffer_[0] = int_buffer_[1];
                int_offset_[0] = int_offset_[1];
                int_buffer_[1] = toInteger(token);
                int_offset_[1] = offset;
                continue;
            }
            for (int i = 0; i < int_count_; ++i) {
                add(DPDFObjectHandle::newInteger(int_buffer_[i]), int_offset_[i]);
            }
            int_count_ = 0;
        }

        DPDFObjectHandle object;
        switch (type) {
        case tt::tt_eof:
            throw error(dpdf_e_unexpected_eof, offset, "unexpected EOF; expected " + expected());

        case tt::tt_integer:
            int_buffer_[0] = toInteger(token);
            int_offset_[0] = offset;
            int_count_ = 1;
            continue;

        case tt::tt_real:
            object = DPDFObject::create<DPDF_Real>(token.getValue());
            break;

        case tt::tt_string:
            object = DPDFObject::create<DPDF_String>(token.getValue(), token.isHexString());
            break;

        case tt::tt_name:
            object = DPDFObject::create<DPDF_Name>(token.getValue());
            break;

        case tt::tt_bool:
            object = DPDFObject::create<DPDF_Bool>(token.getValue() == "true");
            break;

        case tt::tt_null:
            object = DPDFObject::create<DPDF_Null>();
            break;

        case tt::tt_array_open:
        case tt::tt_dict_open:
            if (!stack_.empty() && stack_.back().state == st_dictionary_key) {
                throw unexpected(token);
            }
            if (stack_.size() >= max_nesting) {
                throw error(
                    dpdf_e_invalid_object,
                    offset,
                    "maximum nesting depth of " + std::to_string(max_nesting) + " exceeded");
            }
            stack_.emplace_back(type == tt::tt_array_open ? st_array : st_dictionary_key, offset);
            continue;

        case tt::tt_array_close:
            if (stack_.empty() || stack_.back().state != st_array) {
                throw unexpected(token);
            }
            object = DPDFObjectHandle::newArray(stack_.back().olist);
            offset = stack_.back().offset;
            stack_.pop_back();
            break;

        case tt::tt_dict_close:
            if (stack_.empty() || stack_.back().state != st_dictionary_key) {
                throw unexpected(token);
            }
            object = DPDFObjectHandle::newDictionary(stack_.back().dict);
            offset = stack_.back().offset;
            stack_.pop_back();
            break;

        case tt::tt_word:
        case tt::tt_bad:
            throw unexpected(token);
        }

        if (add(object, offset)) {
            return object;
        }
    }
}

bool
DPDFParser::add(DPDFObjectHandle const& obj, dpdf_offset_t offset)
{
    if (stack_.empty()) {
        return true;
    }
    auto& frame = stack_.back();
    switch (frame.state) {
    case st_array:
        frame.olist.emplace_back(obj);
        break;

    case st_dictionary_key:
        if (!obj.isName()) {
            throw error(
                dpdf_e_unexpected_token,
                offset,
                std::string("expected dictionary key but found ") + obj.getTypeName());
        }
        frame.key = obj.getName();
        frame.state = st_dictionary_value;
        break;

    case st_dictionary_value:
        {
            // A repeated key keeps its first position and takes the last value.
            auto iter = frame.dict.begin();
            for (; iter != frame.dict.end(); ++iter) {
                if (iter->first == frame.key) {
                    break;
                }
            }
            if (iter == frame.dict.end()) {
                frame.dict.emplace_back(frame.key, obj);
            } else {
                iter->second = obj;
            }
            frame.state = st_dictionary_key;
        }
        break;
    }
    return false;
}

long long
DPDFParser::toInteger(DPDFTokenizer::Token const& token)
{
    try {
        return DUtil::string_to_ll(token.getValue().c_str());
    } catch (std::range_error&) {
        throw error(
            dpdf_e_invalid_object,
            token.getOffset(),
            "integer " + token.getValue() + " is too big");
    }
}

std::string
DPDFParser::expected() const
{
    if (stack_.empty()) {
        return "object";
    }
    switch (stack_.back().state) {
    case st_array:
        return "array item or ]";
    case st_dictionary_key:
        return "dictionary key or >>";
    case st_dictionary_value:
        return "value for dictionary key " + stack_.back().key;
    }
    return "object";
}

void
DPDFParser::readStream(DPDFObjectHandle& object)
{
    // The stream keyword is followed by CR LF or LF. A CR alone is accepted since some writers
    // produce it.
    char ch = '\0';
    if (input_.read(&ch, 1) == 0) {
        throw error(dpdf_e_unexpected_eof, input_.tell(), "EOF after stream keyword");
    }
    if (ch == '\r') {
        if (input_.read(&ch, 1) != 0 && ch != '\n') {
            input_.unreadCh(ch);
            warn(error(
                dpdf_e_corrupted,
                input_.tell(),
                "stream keyword followed by carriage return only"));
        }
    } else if (ch != '\n') {
        throw error(
            dpdf_e_corrupted,
            input_.tell() - 1,
            "stream keyword not followed by proper line terminator");
    }

    // Must get offset before resolving the length since that may use the same input.
    dpdf_offset_t stream_offset = input_.tell();
    size_t length = 0;

    auto length_obj = object.getKey("/Length");
    long long declared = 0;
    if (length_obj.isInteger()) {
        declared = length_obj.getIntValue();
        if (declared < 0) {
            throw error(
                dpdf_e_invalid_object,
                stream_offset,
                "/Length key in stream dictionary is negative");
        }
        length = checkLength(stream_offset, declared);
    } else if (length_obj.isReference()) {
        if (context_ && context_->resolveStreamLength(length_obj, declared)) {
            if (declared < 0) {
                throw error(
                    dpdf_e_invalid_object,
                    stream_offset,
                    "/Length key in stream dictionary is negative");
            }
            length = checkLength(stream_offset, declared);
        } else {
            // The length can't be looked up yet. Take it from the position of endstream and have
            // the document compare it with the declared length later.
            if (!scanForEndstream(stream_offset, length)) {
                throw error(
                    dpdf_e_unexpected_eof, stream_offset, "EOF while looking for endstream");
            }
            if (context_) {
                context_->addDeferredLengthCheck(og_, length_obj, length, stream_offset);
            }
        }
    } else if (length_obj.isNull()) {
        throw error(dpdf_e_invalid_object, stream_offset, "stream dictionary lacks /Length key");
    } else {
        throw error(
            dpdf_e_invalid_object,
            stream_offset,
            "/Length key in stream dictionary is not an integer");
    }

    auto data = input_.read(length, stream_offset);
    if (data.size() != length) {
        throw error(dpdf_e_unexpected_eof, stream_offset, "EOF while reading stream data");
    }
    auto token = tokenizer_.readToken(input_, object_description_, true);
    if (!token.isWord("endstream")) {
        throw error(
            dpdf_e_corrupted,
            token.getOffset(),
            "expected endstream but found " +
                (token.getType() == tt::tt_eof ? std::string("EOF") : token.getRawValue()));
    }

    object = DPDFObject::create<DPDF_Stream>(object, std::move(data));
}

size_t
DPDFParser::checkLength(dpdf_offset_t stream_offset, long long declared)
{
    input_.seek(0, SEEK_END);
    dpdf_offset_t eof = input_.tell();
    if (declared <= eof - stream_offset) {
        input_.seek(stream_offset + declared, SEEK_SET);
        if (tokenizer_.readToken(input_, object_description_, true).isWord("endstream")) {
            return DIntC::to_size(declared);
        }
    }

    size_t scanned = 0;
    if (!scanForEndstream(stream_offset, scanned)) {
        throw error(dpdf_e_unexpected_eof, stream_offset, "EOF while looking for endstream");
    }
    // A declared length that includes the end-of-line marker before endstream is acceptable.
    if (declared >= DIntC::to_longlong(scanned) && declared <= DIntC::to_longlong(scanned) + 2) {
        return scanned;
    }
    auto e = error(
        dpdf_e_corrupted,
        stream_offset,
        "stream /Length is " + std::to_string(declared) + " but endstream follows after " +
            std::to_string(scanned) + " bytes");
    if (context_ && context_->attemptRecovery()) {
        warn(e);
        return scanned;
    }
    throw e;
}

bool
DPDFParser::scanForEndstream(dpdf_offset_t stream_offset, size_t& length)
{
    EndstreamFinder ef;
    if (!input_.findFirst("endstream", stream_offset, 0, ef)) {
        return false;
    }
    dpdf_offset_t end = input_.tell();
    // Drop the single end-of-line marker that precedes endstream.
    if (end - stream_offset >= 2 && input_.read(2, end - 2) == "\r\n") {
        end -= 2;
    } else if (end - stream_offset >= 1) {
        auto last = input_.read(1, end - 1);
        if (last == "\n" || last == "\r") {
            --end;
        }
    }
    length = DIntC::to_size(end - stream_offset);
    return true;
}

DPDFExc
DPDFParser::error(dpdf_error_code_e code, dpdf_offset_t offset, std::string const& msg) const
{
    return {code, input_.getName(), object_description_, offset, msg};
}

DPDFExc
DPDFParser::unexpected(DPDFTokenizer::Token const& token) const
{
    return error(
        dpdf_e_unexpected_token,
        token.getOffset(),
        "expected " + expected() + " but found " + token.getRawValue());
}

void
DPDFParser::warn(DPDFExc const& e)
{
    if (context_) {
        context_->warn(e);
    }
}
