#include <deltapdf/DPDF_private.hh>

#include <deltapdf/BufferInputSource.hh>
#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDFParser.hh>
#include <deltapdf/DUtil.hh>
#include <deltapdf/Util.hh>

#include <cstring>
#include <limits>
#include <set>
#include <stdexcept>
#include <tuple>

using namespace deltapdf;
using namespace std::literals;

void
DPDF::parse()
{
    auto input = newInput();

    PatternFinder hf(*this, *input, &DPDF::findHeader);
    if (!input->findFirst("%PDF-", 0, 1024, hf)) {
        warn(error(dpdf_e_corrupted, "", 0, "can't find PDF header"));
        // 1.2 is the oldest version that makes sense for anything we can read.
        m->pdf_version = "1.2";
    }

    // ISO 32000 says %%EOF must be found within the last 1024 bytes of the file. We add an extra
    // 30 characters to leave room for the startxref stuff.
    input->seek(0, SEEK_END);
    dpdf_offset_t end_offset = input->tell();
    dpdf_offset_t start_offset = (end_offset > 1054 ? end_offset - 1054 : 0);
    PatternFinder sf(*this, *input, &DPDF::findStartxref);
    dpdf_offset_t xref_offset = 0;
    if (input->findLast("startxref", start_offset, 0, sf)) {
        auto t = m->tokenizer.readToken(*input, m->filename, true);
        try {
            xref_offset = DUtil::string_to_ll(t.getValue().c_str());
        } catch (std::range_error&) {
            xref_offset = 0;
        }
    }
    m->startxref = xref_offset;

    try {
        if (xref_offset == 0) {
            throw error(dpdf_e_invalid_xref, "", 0, "can't find startxref");
        }
        try {
            read_xref(xref_offset);
        } catch (DPDFExc&) {
            throw;
        } catch (std::exception& e) {
            throw error(dpdf_e_invalid_xref, "", 0, "error reading xref: "s + e.what());
        }
    } catch (DPDFExc& e) {
        if (!m->attempt_recovery) {
            throw;
        }
        reconstruct_xref(e);
    }

    m->xref_loaded = true;
    checkDeferredLengths();
}

bool
DPDF::findHeader(InputSource& input)
{
    std::string line = input.readLine(1024);
    char const* p = line.c_str();
    if (strncmp(p, "%PDF-", 5) != 0) {
        throw std::logic_error("findHeader is not looking at %PDF-");
    }
    p += 5;
    std::string version;
    // The string returned by line.c_str() is always null-terminated, and a null character stops
    // every loop below.
    bool valid = util::is_digit(*p);
    if (valid) {
        while (util::is_digit(*p)) {
            version.append(1, *p++);
        }
        if ((*p == '.') && util::is_digit(*(p + 1))) {
            version.append(1, *p++);
            while (util::is_digit(*p)) {
                version.append(1, *p++);
            }
        } else {
            valid = false;
        }
    }
    if (valid) {
        m->pdf_version = version;
    }
    return valid;
}

bool
DPDF::findStartxref(InputSource& input)
{
    if (m->tokenizer.readToken(input, m->filename, true).isWord("startxref") &&
        m->tokenizer.readToken(input, m->filename, true).isInteger()) {
        // Position in front of the offset token
        input.seek(input.getLastOffset(), SEEK_SET);
        return true;
    }
    return false;
}

void
DPDF::read_xref(dpdf_offset_t xref_offset)
{
    std::set<dpdf_offset_t> visited;
    auto input = newInput();
    while (xref_offset) {
        visited.insert(xref_offset);
        char buf[7];
        memset(buf, 0, sizeof(buf));
        input->seek(xref_offset, SEEK_SET);
        // Some files have extra whitespace before the xref keyword. Skip it but don't count it
        // against the offset.
        dpdf_offset_t keyword_offset = xref_offset;
        while (util::is_space(input->read(1, keyword_offset)[0])) {
            ++keyword_offset;
        }
        input->seek(keyword_offset, SEEK_SET);
        if (keyword_offset != xref_offset) {
            warn(error(
                dpdf_e_corrupted,
                "",
                xref_offset,
                "extraneous whitespace seen before xref"));
        }
        input->read(buf, sizeof(buf) - 1);
        if ((strncmp(buf, "xref", 4) == 0) && util::is_space(buf[4])) {
            int skip = 4;
            while (util::is_space(buf[skip])) {
                ++skip;
            }
            xref_offset = read_xrefTable(xref_offset, keyword_offset + skip);
        } else {
            xref_offset = read_xrefStream(keyword_offset, true);
        }
        if (visited.count(xref_offset) != 0) {
            throw error(dpdf_e_invalid_xref, "", 0, "loop detected following xref tables");
        }
    }

    if (!m->trailer.isInitialized()) {
        throw error(dpdf_e_invalid_xref, "", 0, "unable to find trailer while reading xref");
    }

    if (!m->xref_table.empty()) {
        auto size = m->trailer.getKey("/Size");
        int max_obj = m->xref_table.rbegin()->first;
        if (size.isInteger() && size.getIntValue() - 1 != max_obj) {
            warn(error(
                dpdf_e_corrupted,
                "",
                0,
                "reported number of objects (" + std::to_string(size.getIntValue()) +
                    ") is not one plus the highest object number (" + std::to_string(max_obj) +
                    ")"));
        }
    }
}

bool
DPDF::parse_xrefFirst(std::string const& line, int& obj, int& num, int& bytes)
{
    // is_space and is_digit both return false on '\0', so this will not overrun the null-terminated
    // buffer.
    char const* p = line.c_str();
    char const* start = line.c_str();

    while (util::is_space(*p)) {
        ++p;
    }
    if (!util::is_digit(*p)) {
        return false;
    }
    std::string obj_str;
    while (util::is_digit(*p)) {
        obj_str.append(1, *p++);
    }
    if (!util::is_space(*p)) {
        return false;
    }
    while (util::is_space(*p)) {
        ++p;
    }
    if (!util::is_digit(*p)) {
        return false;
    }
    std::string num_str;
    while (util::is_digit(*p)) {
        num_str.append(1, *p++);
    }
    // Skip any space including line terminators
    while (util::is_space(*p)) {
        ++p;
    }
    bytes = DIntC::to_int(p - start);
    obj = DUtil::string_to_int(obj_str.c_str());
    num = DUtil::string_to_int(num_str.c_str());
    return true;
}

bool
DPDF::read_bad_xrefEntry(InputSource& input, dpdf_offset_t& f1, int& f2, char& type)
{
    // Reposition after the initial read attempt and reread a line.
    input.seek(input.getLastOffset(), SEEK_SET);
    auto line = input.readLine(30);

    char const* p = line.data();

    // There aren't supposed to be any leading spaces.
    bool invalid = false;
    while (util::is_space(*p)) {
        ++p;
        invalid = true;
    }
    if (!util::is_digit(*p)) {
        return false;
    }
    std::string f1_str;
    while (util::is_digit(*p)) {
        f1_str.append(1, *p++);
    }
    if (!util::is_space(*p)) {
        return false;
    }
    if (util::is_space(*(p + 1))) {
        invalid = true;
    }
    while (util::is_space(*p)) {
        ++p;
    }
    if (!util::is_digit(*p)) {
        return false;
    }
    std::string f2_str;
    while (util::is_digit(*p)) {
        f2_str.append(1, *p++);
    }
    if (!util::is_space(*p)) {
        return false;
    }
    if (util::is_space(*(p + 1))) {
        invalid = true;
    }
    while (util::is_space(*p)) {
        ++p;
    }
    if ((*p == 'f') || (*p == 'n')) {
        type = *p;
    } else {
        return false;
    }
    if ((f1_str.length() != 10) || (f2_str.length() != 5)) {
        invalid = true;
    }

    if (invalid) {
        warn(error(
            dpdf_e_corrupted,
            "xref table",
            input.getLastOffset(),
            "accepting invalid xref table entry"));
    }

    f1 = DUtil::string_to_ll(f1_str.c_str());
    f2 = DUtil::string_to_int(f2_str.c_str());

    return true;
}

// Read an entry the fast way, assuming it is exactly 20 bytes in the standard layout. Fall back to
// read_bad_xrefEntry for anything else.
bool
DPDF::read_xrefEntry(InputSource& input, dpdf_offset_t& f1, int& f2, char& type)
{
    std::array<char, 21> line;
    if (input.read(line.data(), 20) != 20) {
        return false;
    }
    line[20] = '\0';
    char const* p = line.data();

    int f1_len = 0;
    int f2_len = 0;

    // No risk of overflow as 9'999'999'999 < max long long.
    while (*p == '0') {
        ++f1_len;
        ++p;
    }
    while (util::is_digit(*p) && f1_len++ < 10) {
        f1 *= 10;
        f1 += *p++ - '0';
    }
    if (!util::is_space(*p++)) {
        return false;
    }
    // No risk of overflow as 99'999 < max int.
    while (*p == '0') {
        ++f2_len;
        ++p;
    }
    while (util::is_digit(*p) && f2_len++ < 5) {
        f2 *= 10;
        f2 += static_cast<int>(*p++ - '0');
    }
    if (util::is_space(*p++) && (*p == 'f' || *p == 'n')) {
        type = *p;
        if (*(++p) && *(++p) && (*p == '\n' || *p == '\r') && f1_len == 10 && f2_len == 5) {
            return true;
        }
    }
    f1 = 0;
    f2 = 0;
    return read_bad_xrefEntry(input, f1, f2, type);
}

// Read one cross-reference table section and the trailer that follows it. Returns the /Prev
// offset or 0.
dpdf_offset_t
DPDF::read_xrefTable(dpdf_offset_t section_offset, dpdf_offset_t xref_offset)
{
    auto input = newInput();
    input->seek(xref_offset, SEEK_SET);
    std::string line;
    while (true) {
        line.assign(50, '\0');
        input->read(line.data(), line.size());
        int obj = 0;
        int num = 0;
        int bytes = 0;
        if (!parse_xrefFirst(line, obj, num, bytes)) {
            throw error(
                dpdf_e_invalid_xref, "xref table", input->getLastOffset(), "xref syntax invalid");
        }
        input->seek(input->getLastOffset() + bytes, SEEK_SET);
        for (dpdf_offset_t i = obj; i - num < obj; ++i) {
            dpdf_offset_t f1 = 0;
            int f2 = 0;
            char type = '\0';
            if (!read_xrefEntry(*input, f1, f2, type)) {
                throw error(
                    dpdf_e_invalid_xref,
                    "xref table",
                    input->getLastOffset(),
                    "invalid xref entry (obj=" + std::to_string(i) + ")");
            }
            if (type == 'f') {
                insertFreeXrefEntry(DIntC::to_int(i), f2);
            } else {
                insertXrefEntry(DIntC::to_int(i), 1, f1, f2);
            }
        }
        dpdf_offset_t pos = input->tell();
        if (m->tokenizer.readToken(*input, "xref table", true).isWord("trailer")) {
            break;
        }
        input->seek(pos, SEEK_SET);
    }

    dpdf_offset_t trailer_offset = input->tell();
    DPDFObjectHandle cur_trailer = DPDFParser(*input, "trailer", this).parse();
    if (!cur_trailer.isDictionary()) {
        throw error(dpdf_e_invalid_xref, "trailer", trailer_offset, "expected trailer dictionary");
    }

    if (!m->trailer.isInitialized()) {
        if (!cur_trailer.hasKey("/Size")) {
            throw error(
                dpdf_e_invalid_xref,
                "trailer",
                trailer_offset,
                "trailer dictionary lacks /Size key");
        }
        if (!cur_trailer.getKey("/Size").isInteger()) {
            throw error(
                dpdf_e_invalid_xref,
                "trailer",
                trailer_offset,
                "/Size key in trailer dictionary is not an integer");
        }
        m->trailer = cur_trailer;
    }
    addSection(section_offset, cur_trailer);

    if (cur_trailer.hasKey("/XRefStm")) {
        // Hybrid reference file. Entries from the stream fill in whatever the table didn't
        // define, so they have to be read before anything older.
        auto xref_stm = cur_trailer.getKey("/XRefStm");
        if (!xref_stm.isInteger()) {
            throw error(
                dpdf_e_invalid_xref, "trailer", trailer_offset, "invalid /XRefStm in trailer");
        }
        read_xrefStream(xref_stm.getIntValue(), false);
    }

    if (cur_trailer.hasKey("/Prev")) {
        auto prev = cur_trailer.getKey("/Prev");
        if (!prev.isInteger()) {
            throw error(
                dpdf_e_invalid_xref,
                "trailer",
                trailer_offset,
                "/Prev key in trailer dictionary is not an integer");
        }
        return prev.getIntValue();
    }

    return 0;
}

// Read a cross-reference stream. Returns the /Prev offset or 0.
dpdf_offset_t
DPDF::read_xrefStream(dpdf_offset_t xref_offset, bool record_section)
{
    DPDFObjectHandle xref_obj;
    auto input = newInput();
    input->seek(xref_offset, SEEK_SET);
    try {
        xref_obj = DPDFParser(*input, "xref stream", this).parseIndirect();
    } catch (DPDFExc& e) {
        throw error(
            dpdf_e_invalid_xref, "", xref_offset, "xref not found: " + e.getMessageDetail());
    }
    if (!(xref_obj.isStream() && xref_obj.getDict().isDictionaryOfType("/XRef"))) {
        throw error(dpdf_e_invalid_xref, "", xref_offset, "xref not found");
    }
    return processXRefStream(xref_offset, xref_obj, record_section);
}

std::pair<int, std::array<int, 3>>
DPDF::processXRefW(DPDFObjectHandle& dict, std::function<DPDFExc(std::string_view)> damaged)
{
    auto W_obj = dict.getKey("/W");
    if (!(W_obj.isArray() && W_obj.getArrayNItems() >= 3 && W_obj.getArrayItem(0).isInteger() &&
          W_obj.getArrayItem(1).isInteger() && W_obj.getArrayItem(2).isInteger())) {
        throw damaged("Cross-reference stream does not have a proper /W key");
    }

    std::array<int, 3> W;
    int entry_size = 0;
    auto w_vector = W_obj.getArrayAsVector();
    int max_bytes = sizeof(dpdf_offset_t);
    for (size_t i = 0; i < 3; ++i) {
        auto w = w_vector[i].getIntValue();
        if (w < 0) {
            throw damaged("Cross-reference stream's /W contains negative values");
        }
        if (w > max_bytes) {
            throw damaged(
                "Cross-reference stream's /W contains impossibly large values");
        }
        W[i] = static_cast<int>(w);
        entry_size += W[i];
    }
    if (entry_size == 0) {
        throw damaged("Cross-reference stream's /W indicates entry size of 0");
    }
    return {entry_size, W};
}

std::pair<int, std::vector<std::pair<int, int>>>
DPDF::processXRefIndex(
    DPDFObjectHandle& dict, std::function<DPDFExc(std::string_view)> damaged)
{
    auto Index_obj = dict.getKey("/Index");

    if (Index_obj.isNull()) {
        // An absent /Index means a single subsection covering 0 through /Size - 1.
        auto size = dict.getKey("/Size");
        if (!(size.isInteger() && size.getIntValue() >= 0 &&
              size.getIntValue() <= std::numeric_limits<int>::max())) {
            throw damaged("Cross-reference stream does not have a proper /Size key");
        }
        int n = static_cast<int>(size.getIntValue());
        return {n, {{0, n}}};
    }

    if (!Index_obj.isArray()) {
        throw damaged("Cross-reference stream does not have a proper /Index key");
    }
    auto index_vec = Index_obj.getArrayAsVector();
    if ((index_vec.size() % 2) != 0) {
        throw damaged("Cross-reference stream's /Index has an invalid number of values");
    }

    long long num_entries = 0;
    std::vector<std::pair<int, int>> indx;
    indx.reserve(index_vec.size() / 2);
    for (size_t i = 0; i < index_vec.size(); i += 2) {
        auto const& first = index_vec[i];
        auto const& count = index_vec[i + 1];
        if (!(first.isInteger() && count.isInteger())) {
            throw damaged("Cross-reference stream's /Index's items are not all integers");
        }
        auto first_val = first.getIntValue();
        auto count_val = count.getIntValue();
        if (first_val < 0) {
            throw damaged(
                "Cross-reference stream's /Index contains a negative object id");
        }
        if (count_val <= 0) {
            throw damaged(
                "Cross-reference stream's /Index contains an invalid number of entries");
        }
        if (first_val + count_val - 1 > std::numeric_limits<int>::max()) {
            throw damaged(
                "Cross-reference stream's /Index contains an impossibly large object id");
        }
        num_entries += count_val;
        if (num_entries > std::numeric_limits<int>::max()) {
            throw damaged("Cross-reference stream claims to contain too many entries");
        }
        indx.emplace_back(static_cast<int>(first_val), static_cast<int>(count_val));
    }
    return {static_cast<int>(num_entries), indx};
}

dpdf_offset_t
DPDF::processXRefStream(
    dpdf_offset_t xref_offset, DPDFObjectHandle& xref_obj, bool record_section)
{
    auto damaged = [this, xref_offset](std::string_view msg) -> DPDFExc {
        return error(dpdf_e_invalid_xref, "xref stream", xref_offset, std::string(msg));
    };

    auto dict = xref_obj.getDict();

    auto [entry_size, W] = processXRefW(dict, damaged);
    auto [num_entries, indx] = processXRefIndex(dict, damaged);

    std::string data = xref_obj.getStreamData();
    size_t expected_size = DIntC::to_size(entry_size) * DIntC::to_size(num_entries);
    if (data.size() != expected_size) {
        throw damaged(
            "Cross-reference stream data has the wrong size; expected = " +
            std::to_string(expected_size) + "; actual = " + std::to_string(data.size()));
    }

    auto p = reinterpret_cast<unsigned char const*>(data.data());
    for (auto const& [first, count]: indx) {
        int obj = first;
        for (int i = 0; i < count; ++i, ++obj) {
            // Fields are big-endian. A zero-width type field means type 1.
            std::array<unsigned long long, 3> fields{};
            if (W[0] == 0) {
                fields[0] = 1;
            }
            for (size_t j = 0; j < 3; ++j) {
                for (int k = 0; k < W[j]; ++k) {
                    fields[j] <<= 8;
                    fields[j] |= *p++;
                }
            }

            if (fields[0] > 2) {
                throw damaged(
                    "unknown xref stream entry type " + std::to_string(fields[0]) +
                    " for object " + std::to_string(obj));
            }
            if (fields[0] == 0) {
                // The generation of a free entry in an xref stream isn't meaningful.
                insertFreeXrefEntry(obj, 0);
            } else {
                if (fields[1] > static_cast<unsigned long long>(
                                    std::numeric_limits<dpdf_offset_t>::max()) ||
                    fields[2] > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
                    throw damaged(
                        "xref stream entry for object " + std::to_string(obj) + " is out of range");
                }
                insertXrefEntry(
                    obj,
                    static_cast<int>(fields[0]),
                    static_cast<dpdf_offset_t>(fields[1]),
                    static_cast<int>(fields[2]));
            }
        }
    }

    if (record_section) {
        if (!m->trailer.isInitialized()) {
            m->trailer = dict;
        }
        addSection(xref_offset, dict);
    }

    if (dict.hasKey("/Prev")) {
        if (!dict.getKey("/Prev").isInteger()) {
            throw damaged("/Prev key in xref stream dictionary is not an integer");
        }
        return dict.getKey("/Prev").getIntValue();
    }
    return 0;
}

void
DPDF::insertXrefEntry(int obj, int f0, dpdf_offset_t f1, int f2)
{
    // Sections are read newest first, so the first entry seen for an object number is the one
    // that counts. Entries that can't be right are dropped.
    if (!(obj > 0 && f2 >= 0 && f1 >= 0)) {
        return;
    }
    if (f0 == 1 && f2 >= 65535) {
        return;
    }
    if (f0 == 2) {
        if (f1 > std::numeric_limits<int>::max()) {
            return;
        }
        if (f1 == obj) {
            warn(error(
                dpdf_e_corrupted,
                "xref stream",
                0,
                "self-referential object stream " + std::to_string(obj)));
            return;
        }
    }

    auto [iter, created] = m->xref_table.try_emplace(obj);
    if (!created) {
        return;
    }
    iter->second = DPDFXRefEntry(f0, f1, f2);
}

void
DPDF::insertFreeXrefEntry(int obj, int gen)
{
    if (obj < 0 || gen < 0) {
        return;
    }
    m->xref_table.try_emplace(obj, DPDFXRefEntry(0, 0, gen));
}

void
DPDF::addSection(dpdf_offset_t offset, DPDFObjectHandle trailer)
{
    m->xref_offsets.push_back(offset);
    m->trailers.push_back(trailer);
}

void
DPDF::reconstruct_xref(DPDFExc& e)
{
    if (m->reconstructed_xref) {
        // Avoid an infinite loop if reconstruction itself leads back here.
        throw e;
    }
    m->reconstructed_xref = true;

    warn(error(dpdf_e_corrupted, "", 0, "file is damaged"));
    warn(e);
    warn(error(dpdf_e_corrupted, "", 0, "Attempting to reconstruct cross-reference table"));

    // Compressed entries survive. Everything that has a location in the file is found again by
    // the scan below, and a free entry must not hide an object the scan finds.
    for (auto iter = m->xref_table.begin(); iter != m->xref_table.end();) {
        if (iter->second.getType() != 2) {
            iter = m->xref_table.erase(iter);
        } else {
            ++iter;
        }
    }
    if (!m->xref_loaded) {
        m->trailer = DPDFObjectHandle();
        m->trailers.clear();
        m->xref_offsets.clear();
    }

    std::vector<std::tuple<int, int, dpdf_offset_t>> found_objects;
    std::vector<dpdf_offset_t> trailers;

    auto input = newInput();
    input->seek(0, SEEK_END);
    dpdf_offset_t eof = input->tell();
    input->seek(0, SEEK_SET);
    // Don't allow very long tokens here during recovery. All the interesting tokens are covered.
    static size_t const MAX_LEN = 10;
    while (input->tell() < eof) {
        DPDFTokenizer::Token t1 = m->tokenizer.readToken(*input, m->filename, true, MAX_LEN);
        dpdf_offset_t token_start = t1.getOffset();
        if (t1.isInteger()) {
            auto pos = input->tell();
            DPDFTokenizer::Token t2 = m->tokenizer.readToken(*input, m->filename, true, MAX_LEN);
            if (t2.isInteger() &&
                m->tokenizer.readToken(*input, m->filename, true, MAX_LEN).isWord("obj")) {
                // Tokens are at most 10 digits, so these can't overflow a long long.
                long long obj = DUtil::string_to_ll(t1.getValue().c_str());
                long long gen = DUtil::string_to_ll(t2.getValue().c_str());
                if (obj > 0 && obj <= std::numeric_limits<int>::max() && gen >= 0 &&
                    gen < 65535) {
                    found_objects.emplace_back(
                        static_cast<int>(obj), static_cast<int>(gen), token_start);
                }
            }
            input->seek(pos, SEEK_SET);
        } else if (!m->trailer.isInitialized() && t1.isWord("trailer")) {
            trailers.emplace_back(input->tell());
        }
        input->findAndSkipNextEOL();
    }

    // A later definition of an object replaces an earlier one.
    for (auto iter = found_objects.rbegin(); iter != found_objects.rend(); ++iter) {
        auto [obj, gen, offset] = *iter;
        insertXrefEntry(obj, 1, offset, gen);
    }

    for (auto iter = trailers.rbegin(); iter != trailers.rend(); ++iter) {
        input->seek(*iter, SEEK_SET);
        DPDFObjectHandle t;
        try {
            t = DPDFParser(*input, "trailer", this).parse();
        } catch (DPDFExc& te) {
            warn(te);
            continue;
        }
        if (!t.isDictionary()) {
            continue;
        }
        if (t.hasKey("/Root")) {
            m->trailer = t;
            break;
        }
        warn(error(dpdf_e_corrupted, "trailer", *iter, "recovered trailer has no /Root entry"));
    }

    if (m->xref_table.empty()) {
        throw error(
            dpdf_e_invalid_xref, "", 0, "unable to find objects while recovering damaged file");
    }

    if (!m->trailer.isInitialized()) {
        // Look for a catalog among the recovered objects. The highest numbered one wins.
        DPDFObjectHandle root;
        std::vector<std::pair<int, int>> candidates;
        for (auto const& [num, entry]: m->xref_table) {
            if (entry.getType() == 1) {
                candidates.emplace_back(num, entry.getGeneration());
            }
        }
        for (auto const& [num, gen]: candidates) {
            DPDFObjectHandle oh;
            try {
                oh = getObject(num, gen);
            } catch (DPDFExc& oe) {
                warn(oe);
                continue;
            }
            if (oh.isDictionaryOfType("/Catalog")) {
                root = DPDFObjectHandle::newReference(num, gen);
            }
        }
        if (!root.isInitialized()) {
            throw error(
                dpdf_e_invalid_xref,
                "",
                0,
                "unable to find trailer dictionary while recovering damaged file");
        }
        warn(error(
            dpdf_e_corrupted,
            "",
            0,
            "unable to find trailer dictionary while recovering damaged file; using the document "
            "catalog found among the objects"));
        m->trailer = DPDFObjectHandle::newDictionary();
        m->trailer.replaceKey("/Root", root);
        m->trailer.replaceKey(
            "/Size", DPDFObjectHandle::newInteger(m->xref_table.rbegin()->first + 1));
    }

    if (!m->xref_loaded) {
        addSection(m->startxref, m->trailer);
    }
}

void
DPDF::checkDeferredLengths()
{
    auto checks = std::move(m->deferred_lengths);
    m->deferred_lengths.clear();
    for (auto const& check: checks) {
        auto description = "object " + check.og.unparse(' ');
        auto length = resolve(check.length_ref);
        if (!length.isInteger()) {
            throw error(
                dpdf_e_invalid_object,
                description,
                check.offset,
                "stream /Length does not resolve to an integer");
        }
        auto declared = length.getIntValue();
        auto scanned = static_cast<long long>(check.scanned);
        if (declared >= scanned && declared <= scanned + 2) {
            continue;
        }
        auto e = error(
            dpdf_e_corrupted,
            description,
            check.offset,
            "stream /Length " + std::to_string(declared) +
                " does not match the data found before endstream (" + std::to_string(scanned) +
                " bytes)");
        if (!m->attempt_recovery) {
            throw e;
        }
        warn(e);
    }
}
