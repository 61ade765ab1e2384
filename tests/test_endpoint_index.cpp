#include <chtest.hpp>

#include "fakes.h"

#include <chremote/remote/endpoint_index.h>
#include <chremote/remote/service_registry.h>

using chremote::remote::EndpointIndex;
using chremote::remote::ExportEndpointPtr;
using chremote::remote::ServiceRegistry;
using chremote::testing::ExportedWith;
using chremote::testing::FakeExporter;

namespace {

ExportEndpointPtr Export(FakeExporter& exporter, const chremote::remote::ServiceRefPtr& ref, std::string name = "svc") {
    return exporter.ExportService(ref, name, "fw").value();
}

} // namespace

TEST_CASE("EndpointIndex keeps the three maps consistent") {
    ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    auto exporter = std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"});

    EndpointIndex index;
    index.EnsureRecord(ref);
    auto a = Export(*exporter, ref);
    auto b = Export(*exporter, ref);
    REQUIRE(index.Put(a, exporter).ok());
    REQUIRE(index.Put(b, exporter).ok());

    REQUIRE(index.size() == 2);
    REQUIRE(index.HasRecord(ref->id()));
    REQUIRE(index.RecordFor(ref->id()) == std::set<std::string>{a->uid(), b->uid()});
    REQUIRE(index.Lookup(a->uid())->exporter == exporter);
    REQUIRE(index.OwnedBy(exporter.get()).size() == 2);

    auto removed = index.Remove(a->uid());
    REQUIRE(removed.has_value());
    REQUIRE(removed->endpoint == a);
    REQUIRE(index.Get(a->uid()) == nullptr);
    REQUIRE(index.RecordFor(ref->id()) == std::set<std::string>{b->uid()});
    REQUIRE(!index.Remove(a->uid()).has_value());
}

TEST_CASE("EndpointIndex refuses a duplicate uid") {
    ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    auto exporter = std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"});
    exporter->fixed_uid = "dup";

    EndpointIndex index;
    index.EnsureRecord(ref);
    REQUIRE(index.Put(Export(*exporter, ref), exporter).ok());
    auto st = index.Put(Export(*exporter, ref), exporter);
    REQUIRE(st.code() == chremote::StatusCode::already_exists);
    REQUIRE(index.size() == 1);
}

TEST_CASE("EndpointIndex swaps an updated endpoint in place") {
    ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    auto exporter = std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"});

    EndpointIndex index;
    index.EnsureRecord(ref);
    auto ep = Export(*exporter, ref, "old");
    REQUIRE(index.Put(ep, exporter).ok());

    REQUIRE(index.Replace(ep->Renamed("new", ep->properties())).ok());
    REQUIRE(index.Get(ep->uid())->name() == "new");
    REQUIRE(index.List({}, "old").empty());
    REQUIRE(index.List("jsonrpc", "new").size() == 1);

    auto other = std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"}, "other");
    auto stranger = Export(*other, ref);
    REQUIRE(index.Replace(stranger).code() == chremote::StatusCode::not_found);
}

TEST_CASE("EndpointIndex records services without endpoints") {
    ServiceRegistry registry;
    auto first = registry.Register({"demo.A"}, ExportedWith({"jsonrpc"}));
    auto second = registry.Register({"demo.B"}, ExportedWith({"jsonrpc"}));

    EndpointIndex index;
    index.EnsureRecord(second);
    index.EnsureRecord(first);
    index.EnsureRecord(first);

    auto services = index.RecordedServices();
    REQUIRE(services.size() == 2);
    REQUIRE(services[0]->id() == first->id());
    REQUIRE(index.empty());

    auto popped = index.PopRecord(first->id());
    REQUIRE(popped.has_value());
    REQUIRE(popped->empty());
    REQUIRE(!index.PopRecord(first->id()).has_value());
    REQUIRE(!index.HasRecord(first->id()));

    index.DropFromRecord(second->id(), "never-there");
    REQUIRE(index.HasRecord(second->id()));
}

TEST_CASE("EndpointIndex refuses endpoints of a service without record") {
    ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    auto exporter = std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"});

    EndpointIndex index;
    REQUIRE(index.Put(Export(*exporter, ref), exporter).code() == chremote::StatusCode::not_found);
    REQUIRE(!index.HasRecord(ref->id()));

    // A popped record is not brought back by a late Put.
    index.EnsureRecord(ref);
    REQUIRE(index.PopRecord(ref->id()).has_value());
    REQUIRE(index.Put(Export(*exporter, ref), exporter).code() == chremote::StatusCode::not_found);
    REQUIRE(!index.HasRecord(ref->id()));
    REQUIRE(index.empty());
}
