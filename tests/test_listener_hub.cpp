#include <chtest.hpp>

#include "fakes.h"

#include <chremote/remote/listener_hub.h>
#include <chremote/remote/service_registry.h>

using chremote::remote::ListenerHub;
using chremote::testing::ExportedWith;
using chremote::testing::FakeExporter;
using chremote::testing::RecordingListener;

namespace {

// Removes itself from the hub on its first event.
class SelfRemovingListener final : public chremote::remote::IEndpointListener {
public:
    explicit SelfRemovingListener(ListenerHub& hub) : hub_(hub) {}

    void EndpointsAdded(const std::vector<chremote::remote::ExportEndpointPtr>&) override {
        ++calls;
        hub_.Remove(self.lock());
    }

    std::weak_ptr<chremote::remote::IEndpointListener> self;
    int calls = 0;

private:
    ListenerHub& hub_;
};

} // namespace

TEST_CASE("ListenerHub delivers every event kind") {
    chremote::remote::ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    FakeExporter exporter({"jsonrpc"});
    auto ep = exporter.ExportService(ref, "svc", "fw").value();

    ListenerHub hub;
    auto listener = std::make_shared<RecordingListener>();
    hub.Add(listener);
    hub.Add(listener);
    REQUIRE(hub.size() == 1);

    chremote::remote::Properties old = ref->properties();
    hub.EndpointsAdded({ep});
    hub.EndpointUpdated(ep, old);
    hub.EndpointRemoved(ep, &old);
    hub.EndpointRemoved(ep, nullptr);

    REQUIRE(listener->added == std::vector<std::string>{ep->uid()});
    REQUIRE(listener->updated == std::vector<std::string>{ep->uid()});
    REQUIRE(listener->removed.size() == 2);
    REQUIRE(listener->removed_with_old == 1);

    hub.Remove(listener);
    hub.EndpointsAdded({ep});
    REQUIRE(listener->added.size() == 1);
}

TEST_CASE("ListenerHub keeps going past a throwing listener") {
    chremote::remote::ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    FakeExporter exporter({"jsonrpc"});
    auto ep = exporter.ExportService(ref, "svc", "fw").value();

    ListenerHub hub;
    auto bad = std::make_shared<RecordingListener>();
    bad->throw_on_added = true;
    auto good = std::make_shared<RecordingListener>();
    hub.Add(bad);
    hub.Add(good);

    hub.EndpointsAdded({ep});
    REQUIRE(good->added.size() == 1);

    ListenerHub::NotifyAdded(*bad, {ep});
    REQUIRE(bad->added.size() == 2);
}

TEST_CASE("ListenerHub lets a listener remove itself during a broadcast") {
    chremote::remote::ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    FakeExporter exporter({"jsonrpc"});
    auto ep = exporter.ExportService(ref, "svc", "fw").value();

    ListenerHub hub;
    auto leaving = std::make_shared<SelfRemovingListener>(hub);
    leaving->self = leaving;
    auto staying = std::make_shared<RecordingListener>();
    hub.Add(leaving);
    hub.Add(staying);

    hub.EndpointsAdded({ep});
    hub.EndpointsAdded({ep});

    REQUIRE(leaving->calls == 1);
    REQUIRE(staying->added.size() == 2);
    REQUIRE(hub.size() == 1);
}

TEST_CASE("ListenerHub keeps going past a listener throwing on removal") {
    chremote::remote::ServiceRegistry registry;
    auto ref = registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    FakeExporter exporter({"jsonrpc"});
    auto ep = exporter.ExportService(ref, "svc", "fw").value();

    ListenerHub hub;
    auto bad = std::make_shared<RecordingListener>();
    bad->throw_on_removed = true;
    auto good = std::make_shared<RecordingListener>();
    hub.Add(bad);
    hub.Add(good);

    chremote::remote::Properties old = ref->properties();
    hub.EndpointRemoved(ep, &old);

    REQUIRE(bad->removed.size() == 1);
    REQUIRE(good->removed == std::vector<std::string>{ep->uid()});
    REQUIRE(good->removed_with_old == 1);
}
