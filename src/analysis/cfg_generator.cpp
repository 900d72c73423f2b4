#include <trellis/cfg_generator.hpp>
#include <trellis/base64.hpp>
#include <trellis/normalize.hpp>
#include "prompts.hpp"

namespace trellis {

Result<Cfg> CfgGenerator::pseudocode_to_cfg(const std::string& pseudocode) {
    return cache_.get_or_compute("pseudocode_to_cfg", {normalize_code(pseudocode)},
        [&]() -> Result<std::string> {
            std::string prompt = std::string(prompts::PSEUDOCODE_TO_CFG)
                + "\n\nPseudocode:\n" + pseudocode;
            return client_.invoke(prompt, std::nullopt);
        });
}

Result<Cfg> CfgGenerator::flowchart_to_cfg(const std::string& image_base64) {
    // Decode before touching the cache so bad input never reaches the model
    auto bytes = decode_base64(strip_data_url(image_base64));
    TRELLIS_TRY(bytes);

    Attachment image{data_url_mime_type(image_base64, "image/png"),
                     std::move(bytes).value()};

    return cache_.get_or_compute("flowchart_to_cfg", {image_base64},
        [&]() -> Result<std::string> {
            return client_.invoke(prompts::FLOWCHART_TO_CFG, image);
        });
}

} // namespace trellis
