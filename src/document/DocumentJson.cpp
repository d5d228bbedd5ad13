#include "DocumentJson.hpp"

#include <plog/Log.h>

#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace document
{

namespace
{

json propertiesToJson(const PropertiesPtr& props)
{
    if (!props)
        return nullptr;
    json out = json::object();
    for (const auto& [key, value] : props->values())
        out[key] = value;
    return out;
}

PropertiesPtr bagFromJson(const json& obj)
{
    if (!obj.is_object())
        throw std::runtime_error("properties must be an object");
    auto bag = std::make_shared<PropertyBag>();
    for (auto kv = obj.begin(); kv != obj.end(); ++kv)
        bag->set(kv.key(), kv->is_string() ? kv->get<std::string>() : kv->dump());
    return bag;
}

PropertiesPtr propertiesFromJson(const json& parent, const char* key = "properties")
{
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null())
        return nullptr;
    return bagFromJson(*it);
}

json paragraphToJson(const Paragraph& p)
{
    json runs = json::array();
    for (const auto& run : p.runs)
    {
        json spans = json::array();
        for (const auto& span : run.spans)
            spans.push_back(span.text);
        runs.push_back({ { "properties", propertiesToJson(run.properties) }, { "text", std::move(spans) } });
    }
    return { { "type", "paragraph" }, { "properties", propertiesToJson(p.properties) }, { "runs", std::move(runs) } };
}

Paragraph paragraphFromJson(const json& obj)
{
    Paragraph p;
    p.properties = propertiesFromJson(obj);
    auto runs = obj.find("runs");
    if (runs == obj.end())
        return p;
    for (const auto& r : runs->get_ref<const json::array_t&>())
    {
        Run run;
        run.properties = propertiesFromJson(r);
        auto text = r.find("text");
        if (text != r.end())
        {
            // A bare string is accepted as a single span
            if (text->is_string())
            {
                run.spans.push_back({ text->get<std::string>() });
            }
            else
            {
                for (const auto& span : text->get_ref<const json::array_t&>())
                    run.spans.push_back({ span.get<std::string>() });
            }
        }
        p.runs.push_back(std::move(run));
    }
    return p;
}

json tableToJson(const Table& t)
{
    json rows = json::array();
    for (const auto& row : t.rows())
    {
        json cells = json::array();
        for (const auto& cell : row.cells)
        {
            json paragraphs = json::array();
            for (const auto& p : cell.paragraphs)
                paragraphs.push_back(paragraphToJson(p));
            cells.push_back({ { "properties", propertiesToJson(cell.properties) }, { "paragraphs", std::move(paragraphs) } });
        }
        rows.push_back(std::move(cells));
    }
    return { { "type", "table" },
             { "properties", propertiesToJson(t.properties) },
             { "grid", propertiesToJson(t.grid) },
             { "rows", std::move(rows) } };
}

Table tableFromJson(const json& obj)
{
    std::vector<Row> rows;
    for (const auto& r : obj.at("rows").get_ref<const json::array_t&>())
    {
        Row row;
        for (const auto& c : r.get_ref<const json::array_t&>())
        {
            Cell cell;
            cell.properties = propertiesFromJson(c);
            auto paragraphs = c.find("paragraphs");
            if (paragraphs != c.end())
            {
                for (const auto& p : paragraphs->get_ref<const json::array_t&>())
                    cell.paragraphs.push_back(paragraphFromJson(p));
            }
            row.cells.push_back(std::move(cell));
        }
        rows.push_back(std::move(row));
    }

    Table t(std::move(rows));
    t.properties = propertiesFromJson(obj);
    t.grid = propertiesFromJson(obj, "grid");
    return t;
}

json pageToJson(const PageSetup& page)
{
    return { { "width", page.width },
             { "height", page.height },
             { "margin_top", page.margin_top },
             { "margin_right", page.margin_right },
             { "margin_bottom", page.margin_bottom },
             { "margin_left", page.margin_left },
             { "landscape", page.landscape } };
}

PageSetup pageFromJson(const json& obj)
{
    PageSetup page;
    page.width = obj.value("width", page.width);
    page.height = obj.value("height", page.height);
    page.margin_top = obj.value("margin_top", page.margin_top);
    page.margin_right = obj.value("margin_right", page.margin_right);
    page.margin_bottom = obj.value("margin_bottom", page.margin_bottom);
    page.margin_left = obj.value("margin_left", page.margin_left);
    page.landscape = obj.value("landscape", page.landscape);
    return page;
}

} // namespace

json toJson(const Document& doc)
{
    json media = json::array();
    if (doc.media())
    {
        for (const auto& res : doc.media()->resources())
            media.push_back({ { "name", res.name }, { "content_type", res.content_type }, { "data", res.data } });
    }

    json body = json::array();
    for (const auto& item : doc.body.items)
    {
        if (const auto* p = std::get_if<Paragraph>(&item))
            body.push_back(paragraphToJson(*p));
        else if (const auto* t = std::get_if<Table>(&item))
            body.push_back(tableToJson(*t));
        else if (const auto* block = std::get_if<OpaqueBlock>(&item))
            body.push_back({ { "type", "opaque" }, { "kind", block->kind }, { "payload", block->payload } });
    }

    return { { "theme", doc.theme }, { "page", pageToJson(doc.page) }, { "media", std::move(media) },
             { "body", std::move(body) } };
}

bool fromJson(const json& in, Document& out, std::string& error)
{
    try
    {
        if (!in.is_object())
        {
            error = "document must be a JSON object";
            return false;
        }

        Document doc;
        doc.theme = in.value("theme", std::string());
        if (auto page = in.find("page"); page != in.end())
            doc.page = pageFromJson(*page);

        auto media = std::make_shared<MediaSet>();
        if (auto list = in.find("media"); list != in.end())
        {
            for (const auto& m : list->get_ref<const json::array_t&>())
            {
                MediaResource res;
                res.name = m.at("name").get<std::string>();
                res.content_type = m.value("content_type", std::string());
                if (auto data = m.find("data"); data != m.end())
                    res.data = data->get<std::vector<std::uint8_t>>();
                media->add(std::move(res));
            }
        }
        doc.setMedia(std::move(media));

        std::size_t index = 0;
        for (const auto& item : in.at("body").get_ref<const json::array_t&>())
        {
            const auto type = item.at("type").get<std::string>();
            if (type == "paragraph")
            {
                doc.body.items.emplace_back(paragraphFromJson(item));
            }
            else if (type == "table")
            {
                doc.body.items.emplace_back(tableFromJson(item));
            }
            else if (type == "opaque")
            {
                doc.body.items.emplace_back(
                    OpaqueBlock{ item.value("kind", std::string()), item.value("payload", std::string()) });
            }
            else
            {
                error = "body item " + std::to_string(index) + " has unknown type '" + type + "'";
                return false;
            }
            ++index;
        }

        out = std::move(doc);
        return true;
    }
    catch (const std::exception& ex)
    {
        error = std::string("invalid document: ") + ex.what();
        return false;
    }
}

bool loadDocument(const std::string& path, Document& out, std::string& error)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        error = "cannot open " + path;
        return false;
    }

    json in = json::parse(ifs, nullptr, false);
    if (in.is_discarded())
    {
        error = path + " is not valid JSON";
        return false;
    }

    if (!fromJson(in, out, error))
        return false;

    PLOG_INFO << "Loaded " << out.body.items.size() << " body items from " << path;
    return true;
}

bool saveDocument(const std::string& path, const Document& doc, std::string& error)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        error = "cannot open " + path + " for writing";
        return false;
    }

    ofs << toJson(doc).dump(2) << '\n';
    ofs.flush();
    if (!ofs)
    {
        error = "failed writing " + path;
        return false;
    }

    PLOG_INFO << "Saved document to " << path;
    return true;
}

} // namespace document
