#include "card_csv.hpp"

#include <stdexcept>

namespace cardposter::exporter {

namespace {

const char* OriginName(cardposter::v1::ImageOrigin origin) {
  switch (origin) {
    case cardposter::v1::IMAGE_ORIGIN_CACHE:
      return "cache";
    case cardposter::v1::IMAGE_ORIGIN_NETWORK:
      return "network";
    case cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER:
      return "placeholder";
    default:
      return "";
  }
}

} // namespace

std::string EscapeCsv(std::string_view field) {
  if (field.find_first_of("\",\n\r") == std::string_view::npos) {
    return std::string(field);
  }
  std::string escaped = "\"";
  for (const char c : field) {
    if (c == '"') escaped += '"';
    escaped += c;
  }
  escaped += '"';
  return escaped;
}

std::string BuildCardCsv(const ExportResult& result, const std::vector<layout::PagePlan>& pages) {
  std::string out = "card_id,name,set_name,artist,generation,dex_number,image_url,page,row,column,origin,failure_reason\n";

  size_t index = 0;
  for (const auto& page : pages) {
    for (const auto& cell : page.cells) {
      if (index >= result.cards.size()) {
        throw std::invalid_argument("card outcomes do not cover the page plan");
      }
      const auto& card    = cell.card;
      const auto& outcome = result.cards[index++];

      out += EscapeCsv(card.id()) + ',';
      out += EscapeCsv(card.name()) + ',';
      out += EscapeCsv(card.set_name()) + ',';
      out += EscapeCsv(card.artist()) + ',';
      out += std::to_string(card.generation()) + ',';
      out += std::to_string(card.dex_number()) + ',';
      out += EscapeCsv(card.image_url()) + ',';
      out += std::to_string(page.page_index + 1) + ',';
      out += std::to_string(outcome.row + 1) + ',';
      out += std::to_string(outcome.column + 1) + ',';
      out += OriginName(outcome.origin);
      out += ',';
      out += EscapeCsv(outcome.failure_reason);
      out += '\n';
    }
  }
  return out;
}

} // namespace cardposter::exporter
