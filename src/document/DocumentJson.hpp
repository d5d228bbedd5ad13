#pragma once

#include "Document.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace document
{

// JSON interchange for the document model.
//
// {
//   "theme": "Office",
//   "page": { "width": 11906, "height": 16838, ... },
//   "media": [ { "name": "image1.png", "content_type": "image/png", "data": [137, 80, ...] } ],
//   "body": [
//     { "type": "paragraph", "properties": {...}, "runs": [ { "properties": {...}, "text": ["Hello ", "world"] } ] },
//     { "type": "table", "properties": {...}, "grid": {...},
//       "rows": [ [ { "properties": {...}, "paragraphs": [ ... ] } ] ] },
//     { "type": "opaque", "kind": "sectPr", "payload": "..." }
//   ]
// }
//
// Property objects map strings to strings; other scalar values are kept in
// their JSON text form. A missing "properties" key loads as a null handle.

nlohmann::json toJson(const Document& doc);
bool fromJson(const nlohmann::json& json, Document& out, std::string& error);

bool loadDocument(const std::string& path, Document& out, std::string& error);
bool saveDocument(const std::string& path, const Document& doc, std::string& error);

} // namespace document
