#pragma once

#include "sn/markdown/engine.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace sn::edit
{

nlohmann::json decorationToJson(std::string_view text, const sn::markdown::Decoration &decoration);

// Line classifications and the decoration pass for text, with the cursor
// line active when a cursor offset is given.
nlohmann::json dumpDocument(std::string_view text, std::optional<std::size_t> cursor,
                            const sn::markdown::EngineSettings &settings);

} // namespace sn::edit
