#include "io/image_loader.hpp"

#include <dcmtk/config/osconfig.h>   // MUST be first with DCMTK on some platforms
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcxfer.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vqhuff {
namespace {

// ---------------- PGM ---------------- //

struct PgmHeader {
    int width = 0;
    int height = 0;
    int maxval = 0;
};

void skip_ws_and_comments(std::istream& is) {
    while (true) {
        int c = is.peek();
        if (c == '#') {
            std::string dummy;
            std::getline(is, dummy);
            continue;
        }
        if (c == EOF) return;
        if (std::isspace(static_cast<unsigned char>(c))) {
            is.get();
            continue;
        }
        return;
    }
}

int read_pgm_int(std::istream& is, const char* what, const std::string& path) {
    skip_ws_and_comments(is);
    int v = 0;
    if (!(is >> v)) throw std::runtime_error(std::string("PGM: cannot read ") + what + ": " + path);
    return v;
}

PgmHeader read_pgm_header(std::istream& is, const std::string& path) {
    std::string magic;
    is >> magic;
    if (magic != "P5") throw std::runtime_error("PGM: only binary P5 is supported: " + path);

    PgmHeader h;
    h.width = read_pgm_int(is, "width", path);
    h.height = read_pgm_int(is, "height", path);
    h.maxval = read_pgm_int(is, "maxval", path);
    if (h.width <= 0 || h.height <= 0) throw std::runtime_error("PGM: invalid size: " + path);
    if (h.maxval <= 0 || h.maxval > 65535) throw std::runtime_error("PGM: invalid maxval: " + path);

    // exactly one whitespace byte separates header and raster
    is.get();
    return h;
}

int bits_for_maxval(int maxval) {
    int bits = 1;
    while (bits < 16 && ((1 << bits) - 1) < maxval) ++bits;
    return bits;
}

Image load_pgm(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);

    const PgmHeader h = read_pgm_header(ifs, path);

    Image im;
    im.width = h.width;
    im.height = h.height;
    im.channels = 1;
    im.bits_allocated = (h.maxval <= 255) ? 8 : 16;
    im.bits_stored = bits_for_maxval(h.maxval);
    im.is_signed = false;
    im.type = (im.bits_allocated == 8) ? PixelType::U8 : PixelType::U16;

    const size_t n = static_cast<size_t>(h.width) * h.height;
    const size_t sample_bytes = (im.bits_allocated == 8) ? 1 : 2;
    std::vector<uint8_t> raw(n * sample_bytes);
    ifs.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (ifs.gcount() != static_cast<std::streamsize>(raw.size())) {
        throw std::runtime_error("PGM payload too short: " + path);
    }

    im.pixels.resize(n);
    for (size_t i = 0; i < n; ++i) {
        // 16-bit PGM samples are big-endian
        im.pixels[i] = (sample_bytes == 1)
            ? static_cast<int32_t>(raw[i])
            : static_cast<int32_t>((static_cast<uint16_t>(raw[2 * i]) << 8) | raw[2 * i + 1]);
    }
    return im;
}

// ---------------- DICOM ---------------- //

std::runtime_error dcmtk_error(const std::string& where, const OFCondition& cond) {
    return std::runtime_error(where + ": " + cond.text());
}

void require(bool ok, const std::string& msg) {
    if (!ok) throw std::runtime_error(msg);
}

Uint16 require_u16(DcmDataset* ds, const DcmTagKey& tag, const char* name) {
    Uint16 v = 0;
    OFCondition st = ds->findAndGetUint16(tag, v);
    if (st.bad()) throw dcmtk_error(std::string("Missing/invalid ") + name, st);
    return v;
}

int instance_number(const std::string& path) {
    DcmFileFormat file;
    OFCondition st = file.loadFile(path.c_str(), EXS_Unknown, EGL_noChange, 0);
    if (st.bad()) return 0;
    DcmDataset* ds = file.getDataset();
    if (!ds) return 0;

    Sint32 inst = 0;
    if (ds->findAndGetSint32(DCM_InstanceNumber, inst).good()) return static_cast<int>(inst);
    return 0;
}

Image load_dicom(const std::string& path) {
    DcmFileFormat file;
    OFCondition st = file.loadFile(path.c_str(), EXS_Unknown, EGL_noChange, DCM_MaxReadLength);
    if (st.bad()) throw dcmtk_error("loadFile failed (" + path + ")", st);

    DcmDataset* ds = file.getDataset();
    require(ds != nullptr, "Dataset is null: " + path);

    const DcmXfer xfer(ds->getOriginalXfer());
    require(!xfer.isEncapsulated(),
            "Compressed/encapsulated DICOM is not supported (TransferSyntax=" +
            std::string(xfer.getXferName()) + "): " + path);

    const Uint16 rows = require_u16(ds, DCM_Rows, "Rows");
    const Uint16 cols = require_u16(ds, DCM_Columns, "Columns");
    const Uint16 bits_stored = require_u16(ds, DCM_BitsStored, "BitsStored");
    const Uint16 bits_allocated = require_u16(ds, DCM_BitsAllocated, "BitsAllocated");
    const Uint16 pixel_rep = require_u16(ds, DCM_PixelRepresentation, "PixelRepresentation");

    Uint16 spp = 1;
    if (ds->findAndGetUint16(DCM_SamplesPerPixel, spp).good()) {
        require(spp == 1, "Only SamplesPerPixel=1 (grayscale) is supported: " + path);
    }
    OFString photo;
    if (ds->findAndGetOFString(DCM_PhotometricInterpretation, photo).good()) {
        require(photo == "MONOCHROME2",
                "Unsupported PhotometricInterpretation: " + std::string(photo.c_str()) + " (" + path + ")");
    }
    Sint32 frames = 1;
    if (ds->findAndGetSint32(DCM_NumberOfFrames, frames).good()) {
        require(frames == 1, "Only single-frame DICOM is supported: " + path);
    }
    require(bits_allocated == 8 || bits_allocated == 16, "Only BitsAllocated=8 or 16 is supported: " + path);
    require(bits_stored >= 1 && bits_stored <= bits_allocated, "Invalid BitsStored: " + path);

    Image im;
    im.width = static_cast<int>(cols);
    im.height = static_cast<int>(rows);
    im.channels = 1;
    im.bits_stored = static_cast<int>(bits_stored);
    im.bits_allocated = static_cast<int>(bits_allocated);
    im.is_signed = (pixel_rep == 1);
    im.type = im.is_signed ? PixelType::S16 : (bits_allocated <= 8 ? PixelType::U8 : PixelType::U16);

    const size_t n = static_cast<size_t>(cols) * rows;
    im.pixels.resize(n);

    if (bits_allocated == 8) {
        const Uint8* u8 = nullptr;
        st = ds->findAndGetUint8Array(DCM_PixelData, u8);
        if (st.bad() || !u8) throw dcmtk_error("Failed to read Uint8 PixelData", st);
        for (size_t i = 0; i < n; ++i) im.pixels[i] = static_cast<int32_t>(u8[i]);
        return im;
    }

    // PixelData with VR=OW may refuse the signed accessor; read the raw
    // 16-bit words and reinterpret when PixelRepresentation says signed.
    const Uint16* u16 = nullptr;
    st = ds->findAndGetUint16Array(DCM_PixelData, u16);
    if (st.bad() || !u16) throw dcmtk_error("Failed to read 16-bit PixelData", st);
    for (size_t i = 0; i < n; ++i) {
        im.pixels[i] = im.is_signed ? static_cast<int32_t>(static_cast<int16_t>(u16[i]))
                                    : static_cast<int32_t>(u16[i]);
    }
    return im;
}

Image load_dicom_series(const std::string& dir) {
    namespace fs = std::filesystem;
    struct Slice { std::string path; int instance; };
    std::vector<Slice> slices;
    for (const auto& ent : fs::directory_iterator(dir)) {
        if (!ent.is_regular_file()) continue;
        const std::string p = ent.path().string();
        slices.push_back({p, instance_number(p)});
    }
    require(!slices.empty(), "No files in folder: " + dir);
    std::stable_sort(slices.begin(), slices.end(),
                     [](const Slice& a, const Slice& b) { return a.instance < b.instance; });

    std::string last_error;
    for (const auto& s : slices) {
        try {
            return load_dicom(s.path);
        } catch (const std::runtime_error& e) {
            last_error = e.what(); // not a DICOM slice, try the next file
        }
    }
    throw std::runtime_error("No readable DICOM found in folder: " + dir + " (last error: " + last_error + ")");
}

bool has_pgm_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    for (auto& ch : ext) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return ext == ".pgm";
}

} // namespace

Image load_image(const std::string& path) {
    namespace fs = std::filesystem;
    if (fs::is_directory(path)) {
        return load_dicom_series(path);
    }
    if (has_pgm_extension(path)) {
        return load_pgm(path);
    }
    return load_dicom(path);
}

} // namespace vqhuff
