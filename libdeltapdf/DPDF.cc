#include <deltapdf/DPDF_private.hh>

#include <deltapdf/BufferInputSource.hh>
#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDFObject_private.hh>
#include <deltapdf/DPDFParser.hh>
#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/DUtil.hh>
#include <deltapdf/Util.hh>

#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

using namespace deltapdf;

namespace
{
    // Keys that a page takes from its ancestors in the page tree if it doesn't have them itself
    char const* const inheritable_keys[] = {"/Resources", "/MediaBox", "/Rotate"};
} // namespace

DPDF::ResolveRecorder::ResolveRecorder(DPDF& dpdf, DPDFObjGen og) :
    dpdf(dpdf),
    og(og)
{
    if (!dpdf.m->resolving.insert(og).second) {
        throw dpdf.error(
            dpdf_e_invalid_object,
            "object " + og.unparse(' '),
            0,
            "loop detected resolving object " + og.unparse(' '));
    }
}

DPDF::ResolveRecorder::~ResolveRecorder()
{
    dpdf.m->resolving.erase(og);
}

DPDF::Members::Members() :
    log(DPDFLogger::defaultLogger())
{
}

DPDF::DPDF() :
    m(std::make_unique<Members>())
{
}

DPDF::~DPDF() = default;

std::shared_ptr<DPDF>
DPDF::create()
{
    return std::make_shared<DPDF>();
}

void
DPDF::processFile(char const* filename)
{
    std::shared_ptr<std::string const> buffer;
    try {
        buffer = std::make_shared<std::string const>(DUtil::read_file_into_string(filename));
    } catch (std::runtime_error& e) {
        throw DPDFExc(dpdf_e_system, filename, "", 0, e.what());
    }
    processBuffer(filename, buffer);
}

void
DPDF::processMemoryFile(char const* description, char const* buf, size_t length)
{
    processBuffer(description, std::make_shared<std::string const>(buf, length));
}

void
DPDF::processBuffer(std::string const& description, std::shared_ptr<std::string const> buffer)
{
    if (m->processed) {
        throw std::logic_error("DPDF: a file has already been processed");
    }
    m->filename = description;
    m->buffer = buffer;
    m->processed = true;
    parse();
}

void
DPDF::setAttemptRecovery(bool val)
{
    m->attempt_recovery = val;
}

void
DPDF::setSuppressWarnings(bool val)
{
    m->suppress_warnings = val;
}

void
DPDF::setLogger(std::shared_ptr<DPDFLogger> l)
{
    m->log = l ? l : DPDFLogger::defaultLogger();
}

std::shared_ptr<DPDFLogger>
DPDF::getLogger()
{
    return m->log;
}

std::vector<DPDFExc>
DPDF::getWarnings()
{
    std::vector<DPDFExc> result = std::move(m->warnings);
    m->warnings.clear();
    return result;
}

bool
DPDF::anyWarnings() const
{
    return !m->warnings.empty();
}

void
DPDF::warn(DPDFExc const& e)
{
    m->warnings.push_back(e);
    if (!m->suppress_warnings) {
        m->log->warn("WARNING: "s + e.what() + "\n");
    }
}

DPDFExc
DPDF::error(
    dpdf_error_code_e code,
    std::string const& object,
    dpdf_offset_t offset,
    std::string const& message)
{
    return {code, m->filename, object, offset, message};
}

void
DPDF::checkProcessed() const
{
    if (!m->processed) {
        throw std::logic_error(
            "DPDF operation attempted before processFile or processMemoryFile was called");
    }
}

std::unique_ptr<BufferInputSource>
DPDF::newInput()
{
    // Each read gets its own cursor so that resolving an object in the middle of parsing another
    // one can't disturb the outer parse.
    return std::make_unique<BufferInputSource>(m->filename, m->buffer);
}

bool
DPDF::attemptRecovery() const
{
    return m->attempt_recovery;
}

std::string
DPDF::getFilename() const
{
    return m->filename;
}

std::string
DPDF::getPDFVersion() const
{
    return m->pdf_version;
}

DPDFObjectHandle
DPDF::getTrailer()
{
    checkProcessed();
    return m->trailer;
}

DPDFObjectHandle
DPDF::getRootReference()
{
    return getTrailer().getKey("/Root");
}

DPDFObjectHandle
DPDF::getRoot()
{
    auto root = resolve(getRootReference());
    if (!root.isDictionary()) {
        throw error(dpdf_e_invalid_object, "trailer", 0, "unable to find /Root dictionary");
    }
    return root;
}

DPDFObjectHandle
DPDF::getCatalog()
{
    return getRoot();
}

DPDFObjectHandle
DPDF::getInfo()
{
    auto info = resolve(getTrailer().getKey("/Info"));
    return info.isDictionary() ? info : DPDFObjectHandle::newNull();
}

bool
DPDF::isEncrypted()
{
    return getTrailer().hasKey("/Encrypt");
}

bool
DPDF::isLinearized()
{
    checkProcessed();
    // A linearized file's first object is a dictionary with a /Linearized key and is contained
    // within the first 1024 bytes of the file.
    static int const tbuf_size = 1025;

    auto input = newInput();
    auto b = std::make_unique<char[]>(tbuf_size);
    char* buf = b.get();
    memset(buf, '\0', tbuf_size);
    input->read(buf, tbuf_size - 1);

    DPDFObjGen lindict_og;
    char* p = buf;
    while (!lindict_og.isIndirect()) {
        // Find a digit or end of buffer
        while (((p - buf) < tbuf_size) && (!util::is_digit(*p))) {
            ++p;
        }
        if (p - buf == tbuf_size) {
            break;
        }
        // Seek to the digit. Then skip over digits for a potential next iteration.
        input->seek(p - buf, SEEK_SET);
        while (((p - buf) < tbuf_size) && util::is_digit(*p)) {
            ++p;
        }

        auto t1 = m->tokenizer.readToken(*input, "linearization dictionary", true, 10);
        auto t2 = m->tokenizer.readToken(*input, "linearization dictionary", true, 10);
        if (t1.isInteger() && t2.isInteger() &&
            m->tokenizer.readToken(*input, "linearization dictionary", true, 10).isWord("obj") &&
            m->tokenizer.readToken(*input, "linearization dictionary", true, 10).getType() ==
                DPDFTokenizer::tt_dict_open) {
            // Tokens of at most 10 characters may still be too large for an int.
            auto objid = DUtil::string_to_ll(t1.getValue().c_str());
            auto generation = DUtil::string_to_ll(t2.getValue().c_str());
            if (objid > 0 && objid <= std::numeric_limits<int>::max() && generation >= 0 &&
                generation <= std::numeric_limits<int>::max()) {
                lindict_og = DPDFObjGen(static_cast<int>(objid), static_cast<int>(generation));
            }
        }
    }
    if (!lindict_og.isIndirect()) {
        return false;
    }

    auto candidate = getObject(lindict_og);
    if (!candidate.isDictionary()) {
        return false;
    }
    auto linkey = candidate.getKey("/Linearized");
    return linkey.isNumber() && static_cast<int>(floor(linkey.getNumericValue())) == 1;
}

DPDFObjectHandle
DPDF::getObject(int objid, int generation)
{
    return getObject(DPDFObjGen(objid, generation));
}

DPDFObjectHandle
DPDF::getObject(DPDFObjGen og)
{
    checkProcessed();
    if (!og.isIndirect()) {
        return DPDFObjectHandle::newNull();
    }
    auto cached = m->obj_cache.find(og);
    if (cached != m->obj_cache.end()) {
        return cached->second;
    }
    return resolveObjGen(og);
}

DPDFObjectHandle
DPDF::resolveObjGen(DPDFObjGen og)
{
    auto iter = m->xref_table.find(og.getObj());
    if (iter == m->xref_table.end() || iter->second.isFree() ||
        iter->second.getGeneration() != og.getGen()) {
        // The PDF specification says that references to missing objects are references to null.
        return DPDFObjectHandle::newNull();
    }
    auto const entry = iter->second;

    ResolveRecorder rr(*this, og);
    std::string description = "object " + og.unparse(' ');
    DPDFObjectHandle result;
    switch (entry.getType()) {
    case 1:
        result = readObjectAtOffset(true, entry.getOffset(), description, og);
        break;

    case 2:
        {
            resolveObjectsInStream(entry.getObjStreamNumber());
            auto cached = m->obj_cache.find(og);
            if (cached == m->obj_cache.end()) {
                throw error(
                    dpdf_e_invalid_object,
                    description,
                    0,
                    "object not found in object stream " +
                        std::to_string(entry.getObjStreamNumber()));
            }
            return cached->second;
        }

    default:
        throw error(dpdf_e_invalid_xref, description, 0, "object has unexpected xref entry type");
    }
    m->obj_cache[og] = result;
    return result;
}

DPDFObjectHandle
DPDF::readObjectAtOffset(
    bool try_recovery, dpdf_offset_t offset, std::string const& description, DPDFObjGen og)
{
    if (!m->attempt_recovery || m->reconstructed_xref) {
        try_recovery = false;
    }

    // Some writers store deleted objects in the xref table as "0000000000 00000 n". Treat them as
    // null.
    if (offset == 0) {
        warn(error(dpdf_e_invalid_xref, description, 0, "object has offset 0"));
        return DPDFObjectHandle::newNull();
    }

    auto input = newInput();
    input->seek(offset, SEEK_SET);
    try {
        return DPDFParser(*input, description, this).parseIndirect(og);
    } catch (DPDFExc& e) {
        if (!try_recovery) {
            throw;
        }
        // Try again after reconstructing xref table
        reconstruct_xref(e);
        auto iter = m->xref_table.find(og.getObj());
        if (iter != m->xref_table.end() && iter->second.getType() == 1 &&
            iter->second.getGeneration() == og.getGen()) {
            return readObjectAtOffset(false, iter->second.getOffset(), description, og);
        }
        warn(error(
            dpdf_e_invalid_object,
            description,
            0,
            "object not found in file after regenerating cross reference table"));
        return DPDFObjectHandle::newNull();
    }
}

void
DPDF::resolveObjectsInStream(int obj_stream_number)
{
    if (m->resolved_object_streams.count(obj_stream_number)) {
        return;
    }
    std::string description = "object stream " + std::to_string(obj_stream_number);

    auto obj_stream = getObject(obj_stream_number, 0);
    if (!obj_stream.isStream()) {
        throw error(
            dpdf_e_invalid_object,
            description,
            0,
            "supposed object stream " + std::to_string(obj_stream_number) + " is not a stream");
    }
    auto dict = obj_stream.getDict();
    if (!dict.isDictionaryOfType("/ObjStm")) {
        warn(error(
            dpdf_e_invalid_object,
            description,
            0,
            "supposed object stream " + std::to_string(obj_stream_number) + " has wrong type"));
    }
    auto n_obj = dict.getKey("/N");
    auto first_obj = dict.getKey("/First");
    if (!(n_obj.isInteger() && first_obj.isInteger() && n_obj.getIntValue() >= 0 &&
          first_obj.getIntValue() >= 0)) {
        throw error(
            dpdf_e_invalid_object,
            description,
            0,
            "object stream " + std::to_string(obj_stream_number) + " has incorrect keys");
    }
    auto n = n_obj.getIntValue();
    auto first = first_obj.getIntValue();

    auto data = getStreamData(obj_stream);
    BufferInputSource input(m->filename + " " + description, data);

    // The header is a list of pairs of object number and offset relative to /First.
    std::vector<std::pair<int, long long>> offsets;
    for (long long i = 0; i < n; ++i) {
        auto tnum = m->tokenizer.readToken(input, description, true);
        auto toffset = m->tokenizer.readToken(input, description, true);
        if (!(tnum.isInteger() && toffset.isInteger())) {
            throw error(
                dpdf_e_invalid_object,
                description,
                input.getLastOffset(),
                "expected integer in object stream header");
        }
        int num = 0;
        long long offset = 0;
        try {
            num = DUtil::string_to_int(tnum.getValue().c_str());
            offset = DUtil::string_to_ll(toffset.getValue().c_str());
        } catch (std::range_error&) {
            throw error(
                dpdf_e_invalid_object,
                description,
                input.getLastOffset(),
                "integer out of range in object stream header");
        }
        if (offset < 0) {
            throw error(
                dpdf_e_invalid_object,
                description,
                input.getLastOffset(),
                "negative offset in object stream header");
        }
        offsets.emplace_back(num, offset);
    }

    // Only cache the objects that the xref table says live here. Objects in an older object
    // stream may have been replaced by a later update.
    for (auto const& [num, entry]: m->xref_table) {
        if (entry.getType() != 2 || entry.getObjStreamNumber() != obj_stream_number) {
            continue;
        }
        if (num == obj_stream_number) {
            warn(error(
                dpdf_e_invalid_object, description, 0, "object stream claims to contain itself"));
            continue;
        }
        DPDFObjGen og(num, 0);
        if (m->obj_cache.count(og)) {
            continue;
        }
        // The entry's index normally locates the object. If it doesn't, look for the object
        // number in the header.
        auto index = DIntC::to_size(entry.getObjStreamIndex());
        auto found = offsets.end();
        if (index < offsets.size() && offsets.at(index).first == num) {
            found = offsets.begin() + DIntC::to_offset(index);
        } else {
            for (auto iter = offsets.begin(); iter != offsets.end(); ++iter) {
                if (iter->first == num) {
                    found = iter;
                    break;
                }
            }
        }
        if (found == offsets.end()) {
            continue;
        }
        input.seek(first + found->second, SEEK_SET);
        auto oh = DPDFParser(input, "object " + og.unparse(' '), this).parse();
        oh.setObjGen(og);
        m->obj_cache[og] = oh;
    }
    m->resolved_object_streams.insert(obj_stream_number);
}

DPDFObjectHandle
DPDF::resolve(DPDFObjectHandle oh)
{
    DPDFObjGen::set seen;
    while (oh.isReference()) {
        auto og = oh.getRefObjGen();
        if (!seen.add(og)) {
            throw error(
                dpdf_e_invalid_object,
                "object " + og.unparse(' '),
                0,
                "loop detected resolving object " + og.unparse(' '));
        }
        oh = getObject(og);
    }
    return oh;
}

DPDFObjectHandle
DPDF::resolveAll(DPDFObjectHandle oh)
{
    DPDFObjGen::set path;
    return resolveAllInternal(oh, path);
}

DPDFObjectHandle
DPDF::resolveAllInternal(DPDFObjectHandle oh, DPDFObjGen::set& path)
{
    std::vector<DPDFObjGen> entered;
    while (true) {
        if (oh.isIndirect()) {
            auto og = oh.getObjGen();
            if (!path.add(og)) {
                throw error(
                    dpdf_e_invalid_object,
                    "object " + og.unparse(' '),
                    0,
                    "loop detected resolving object " + og.unparse(' '));
            }
            entered.push_back(og);
        }
        if (!oh.isReference()) {
            break;
        }
        oh = getObject(oh.getRefObjGen());
    }

    DPDFObjectHandle result;
    switch (oh.getTypeCode()) {
    case dpdf_ot_uninitialized:
        result = oh;
        break;

    case dpdf_ot_array:
        {
            std::vector<DPDFObjectHandle> items;
            for (auto const& item: oh.getArrayAsVector()) {
                items.emplace_back(resolveAllInternal(item, path));
            }
            result = DPDFObjectHandle::newArray(items);
        }
        break;

    case dpdf_ot_dictionary:
        {
            DPDFObjectHandle::dict_items_t items;
            for (auto const& [key, value]: oh.getDictItems()) {
                items.emplace_back(key, resolveAllInternal(value, path));
            }
            result = DPDFObjectHandle::newDictionary(items);
        }
        break;

    case dpdf_ot_stream:
        {
            auto stream = oh.obj->as<DPDF_Stream>();
            DPDF_Stream copy(resolveAllInternal(stream->dict, path), stream->data);
            copy.decoded = stream->decoded;
            result = DPDFObjectHandle(std::make_shared<DPDFObject>(std::move(copy)));
        }
        break;

    default:
        result = oh.shallowCopy();
        break;
    }

    for (auto const& og: entered) {
        path.erase(og);
    }
    return result;
}

std::vector<DPDFObjectHandle>
DPDF::getAllPages()
{
    auto pages = resolve(getRoot().getKey("/Pages"));
    if (!pages.isDictionary()) {
        throw error(dpdf_e_invalid_object, "", 0, "unable to find page tree");
    }
    std::vector<DPDFObjectHandle> result;
    DPDFObjGen::set path;
    getAllPagesInternal(pages, {}, path, result);
    return result;
}

void
DPDF::getAllPagesInternal(
    DPDFObjectHandle node,
    std::map<std::string, DPDFObjectHandle> inherited,
    DPDFObjGen::set& path,
    std::vector<DPDFObjectHandle>& result)
{
    auto og = node.getObjGen();
    if (!path.add(og)) {
        throw error(
            dpdf_e_invalid_object, "object " + og.unparse(' '), 0, "loop detected in pages tree");
    }

    auto kids = resolve(node.getKey("/Kids"));
    if (node.isDictionaryOfType("/Page") || !kids.isArray()) {
        auto page = node.shallowCopy();
        for (auto const& [key, value]: inherited) {
            if (!page.hasKey(key)) {
                page.replaceKey(key, value);
            }
        }
        page.setObjGen(og);
        result.push_back(page);
    } else {
        for (auto key: inheritable_keys) {
            if (node.hasKey(key)) {
                inherited[key] = node.getKey(key);
            }
        }
        for (auto const& kid: kids.getArrayAsVector()) {
            auto kid_node = resolve(kid);
            if (!kid_node.isDictionary()) {
                auto e = error(
                    dpdf_e_invalid_object,
                    "object " + og.unparse(' '),
                    0,
                    "/Kids contains a " + std::string(kid_node.getTypeName()) +
                        " instead of a page tree node");
                if (!m->attempt_recovery) {
                    throw e;
                }
                warn(e);
                continue;
            }
            getAllPagesInternal(kid_node, inherited, path, result);
        }
    }
    path.erase(og);
}

int
DPDF::getPageCount()
{
    return DIntC::to_int(getAllPages().size());
}

DPDFObjectHandle
DPDF::getPage(int n)
{
    auto pages = getAllPages();
    if (n < 0 || static_cast<size_t>(n) >= pages.size()) {
        return DPDFObjectHandle::newNull();
    }
    return pages.at(static_cast<size_t>(n));
}

std::string
DPDF::getPageContent(int n)
{
    auto page = getPage(n);
    if (!page.isDictionary()) {
        return "";
    }
    auto contents = resolve(page.getKey("/Contents"));
    if (contents.isStream()) {
        return getStreamData(contents);
    }
    std::string result;
    if (contents.isArray()) {
        for (auto const& item: contents.getArrayAsVector()) {
            auto stream = resolve(item);
            if (stream.isStream()) {
                result += getStreamData(stream);
                result += "\n";
            }
        }
    }
    return result;
}

int
DPDF::getNextObjectId()
{
    checkProcessed();
    if (m->xref_table.empty()) {
        return 1;
    }
    return m->xref_table.rbegin()->first + 1;
}

std::map<int, DPDFXRefEntry> const&
DPDF::getXRefTable() const
{
    checkProcessed();
    return m->xref_table;
}

std::vector<DPDFObjectHandle>
DPDF::getTrailers() const
{
    checkProcessed();
    return m->trailers;
}

std::vector<dpdf_offset_t>
DPDF::getXRefSectionOffsets() const
{
    checkProcessed();
    return m->xref_offsets;
}

dpdf_offset_t
DPDF::getStartXRef() const
{
    checkProcessed();
    return m->startxref;
}

std::string
DPDF::getStreamData(DPDFObjectHandle stream)
{
    stream = resolve(stream);
    if (!stream.isStream()) {
        throw std::logic_error(
            "DPDF::getStreamData called on " + std::string(stream.getTypeName()) + " object");
    }
    auto s = stream.obj->as<DPDF_Stream>();
    if (s->decoded) {
        return *s->decoded;
    }
    auto dict = stream.getDict();
    auto data = DPDFStreamFilter::decode(
        s->data,
        resolveAll(dict.getKey("/Filter")),
        resolveAll(dict.getKey("/DecodeParms")),
        m->filename);
    stream.cacheStreamData(data);
    return data;
}

std::shared_ptr<std::string const>
DPDF::getBuffer() const
{
    checkProcessed();
    return m->buffer;
}

bool
DPDF::resolveStreamLength(DPDFObjectHandle const& ref, long long& length)
{
    if (!m->xref_loaded) {
        return false;
    }
    auto length_obj = resolve(ref);
    if (!length_obj.isInteger()) {
        throw error(
            dpdf_e_invalid_object,
            "object " + ref.getRefObjGen().unparse(' '),
            0,
            "/Length key in stream dictionary is not an integer");
    }
    length = length_obj.getIntValue();
    return true;
}

void
DPDF::addDeferredLengthCheck(
    DPDFObjGen og, DPDFObjectHandle const& ref, size_t scanned, dpdf_offset_t offset)
{
    m->deferred_lengths.push_back({og, ref, scanned, offset});
}
