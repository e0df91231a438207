#include "flexcal/core/errors.hpp"
#include "flexcal/flexure/flexure.hpp"
#include "flexcal/io/fits_io.hpp"

namespace flexcal::flexure {

std::string archive_file_name(const config::ParameterSet& flexure_par,
                              const std::string& spectrograph) {
    const config::OptionalValue& explicit_spec = flexure_par.get("spectrum");
    if (explicit_spec && !explicit_spec->as_string().empty()) {
        return explicit_spec->as_string();
    }
    if (spectrograph == "kast_blue" || spectrograph == "lris_blue") {
        return "sky_kastb_600.fits";
    }
    return "paranal_sky.fits";
}

fs::path resolve_archive_path(const config::ParameterSet& flexure_par,
                              const std::string& spectrograph) {
    const fs::path spec_dir = flexure_par.get_string("spec_dir");
    const fs::path path = spec_dir / archive_file_name(flexure_par, spectrograph);
    if (!fs::exists(path)) {
        throw ConfigurationError("Archived sky spectrum not found: " + path.string());
    }
    return path;
}

spectrum::Spectrum1D load_sky_archive(const fs::path& path) {
    auto [wave, flux] = io::read_sky_archive(path);
    return spectrum::Spectrum1D(std::move(wave), std::move(flux));
}

} // namespace flexcal::flexure
