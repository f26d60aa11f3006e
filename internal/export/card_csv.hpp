#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cardposter/v1.hpp"
#include "internal/export/export_result.hpp"
#include "internal/layout/layout_engine.hpp"

namespace cardposter::exporter {

// Quotes the field when it holds a quote, comma or line break.
std::string EscapeCsv(std::string_view field);

/*
  Card list of a finished export, one row per planned cell in plan order:

    card_id,name,set_name,artist,generation,dex_number,image_url,
    page,row,column,origin,failure_reason

  page, row and column are 1-based. `result.cards` must line up with the
  cells of `pages`.
*/
std::string BuildCardCsv(const ExportResult& result, const std::vector<layout::PagePlan>& pages);

} // namespace cardposter::exporter
