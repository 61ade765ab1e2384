#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <chjson/chjson.hpp>

#include <chremote/core/status.h>
#include <chremote/remote/endpoint.h>

namespace chremote::remote::wire {

// One endpoint as exchanged between frameworks:
// {"sender", "uid", "configurations", "name", "specifications", "properties"}
struct Record {
    std::string sender;
    std::string uid;
    std::vector<std::string> configurations;
    std::string name;
    std::vector<std::string> specifications;
    Properties properties;
};

chjson::value ToJson(const Endpoint& endpoint, std::string_view sender);

// JSON array of records, "[]" when empty.
std::string DumpEndpoints(const std::vector<ExportEndpointPtr>& endpoints, std::string_view sender);
std::string DumpEndpoint(const Endpoint& endpoint, std::string_view sender);

// invalid_argument on a missing or mistyped field.
chremote::Result<Record> ParseRecord(const chjson::sv_value& v);

// Accepts a JSON array of records. An empty body or `null` yields no record.
chremote::Result<std::vector<Record>> ParseRecords(std::string_view body);

// Export properties -> import properties:
// imported=true, exported.configs moved to imported.configs,
// exported.interfaces dropped, framework.uid=sender.
Properties ToImportProperties(Properties properties, std::string_view sender);

// Applies ToImportProperties and tags the endpoint with the announcing host.
chremote::Result<ImportEndpointPtr> ToImportEndpoint(Record record, std::string server_address);

} // namespace chremote::remote::wire
