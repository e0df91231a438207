#include "flexcal/flexure/spec1d_io.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"
#include "flexcal/io/fits_io.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace flexcal::flexure {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::string extraction_extname(const std::string& object, const std::string& method) {
    return object + "-" + to_upper(method);
}

std::vector<SpecObj> read_spec1d(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Spectrum file not found: " + path.string());
    }

    std::vector<SpecObj> objects;
    std::map<std::string, std::size_t> index;
    for (const auto& image : io::read_fits_extensions(path)) {
        const auto dash = image.extname.rfind('-');
        if (dash == std::string::npos || dash == 0 || dash + 1 == image.extname.size()) {
            throw FitsError("Extension name " + image.extname + " in " + path.string() +
                            " is not of the form <object>-<METHOD>");
        }
        if (image.data.rows() != 2) {
            throw FitsError("Extension " + image.extname + " in " + path.string() +
                            " must hold two rows (wavelength, sky)");
        }
        const std::string name = image.extname.substr(0, dash);
        const std::string method = core::to_lower(image.extname.substr(dash + 1));

        auto it = index.find(name);
        if (it == index.end()) {
            it = index.emplace(name, objects.size()).first;
            objects.push_back(SpecObj{name, {}});
        }
        SpecObj& obj = objects[it->second];
        if (obj.extractions.count(method)) {
            throw FitsError("Duplicate extension " + image.extname + " in " + path.string());
        }
        Extraction ext;
        ext.wave = image.data.row(0).transpose();
        ext.sky = image.data.row(1).transpose();
        obj.extractions.emplace(method, std::move(ext));
    }
    return objects;
}

void write_spec1d(const fs::path& path,
                  const std::vector<SpecObj>& objects,
                  const FlexureDetectorResult* result) {
    if (result && result->records.size() != objects.size()) {
        throw ValidationError("Flexure result does not match the number of objects");
    }

    std::vector<io::FitsImage> extensions;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        const SpecObj& obj = objects[i];
        for (const auto& [method, ext] : obj.extractions) {
            if (ext.wave.size() != ext.sky.size()) {
                throw ValidationError("Extraction " + method + " of " + obj.name +
                                      " has mismatched wavelength and sky lengths");
            }
            io::FitsImage image;
            image.extname = extraction_extname(obj.name, method);
            image.data.resize(2, ext.wave.size());
            image.data.row(0) = ext.wave.transpose();
            image.data.row(1) = ext.sky.transpose();
            if (result) {
                const FlexureRecord& rec = result->records[i];
                image.header.set("FLEXSTAT", flexure_status_to_string(rec.status),
                                 "Flexure correction status");
                if (rec.ok()) {
                    image.header.set("FLEXSHFT", rec.shift, "Flexure shift (pixels)");
                }
            }
            extensions.push_back(std::move(image));
        }
    }

    io::FitsHeader header;
    header.set("NOBJ", static_cast<int>(objects.size()), "Number of objects");
    io::write_fits(path, header, std::nullopt, extensions);
}

} // namespace flexcal::flexure
