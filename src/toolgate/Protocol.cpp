//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversions for protocol structures
//==========================================================================================================

#include "toolgate/Protocol.h"

namespace toolgate {

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object o;
    o["type"] = std::make_shared<JSONValue>(std::string("text"));
    o["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{o};
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object t;
    t["name"] = std::make_shared<JSONValue>(tool.name);
    if (tool.title.has_value()) {
        t["title"] = std::make_shared<JSONValue>(tool.title.value());
    }
    t["description"] = std::make_shared<JSONValue>(tool.description);
    if (tool.inputSchema.IsObject()) {
        t["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    } else {
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>(std::string("object"));
        t["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    }
    return JSONValue{t};
}

std::optional<Tool> ToolFromJSON(const JSONValue& value) {
    const JSONValue* name = value.Find("name");
    if (name == nullptr || !name->IsString()) {
        return std::nullopt;
    }
    Tool tool;
    tool.name = std::get<std::string>(name->value);
    if (const JSONValue* d = value.Find("description")) {
        if (d->IsString()) tool.description = std::get<std::string>(d->value);
    }
    if (const JSONValue* t = value.Find("title")) {
        if (t->IsString()) tool.title = std::get<std::string>(t->value);
    }
    if (const JSONValue* s = value.Find("inputSchema")) {
        tool.inputSchema = *s;
    }
    return tool;
}

JSONValue CallToolResultToJSON(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& v : result.content) content.push_back(std::make_shared<JSONValue>(v));
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue{obj};
}

} // namespace toolgate
