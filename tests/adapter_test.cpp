// benchguard headers
#include "adapters/IoTaWattAdapter.hpp"
#include "adapters/ManualAdapter.hpp"
#include "adapters/ShellyAdapter.hpp"
#include "adapters/SnmpPduAdapter.hpp"
#include "core/AdapterFactory.hpp"
#include "core/Errors.hpp"

// benchguard fakes
#include "FakeHttpChannel.hpp"
#include "FakeSnmpChannel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace benchguard::test {

  using namespace benchguard::adapters;
  using benchguard::core::AdapterFactory;
  using benchguard::core::ConfigError;
  using benchguard::core::Outlet;
  using benchguard::core::Station;
  using nlohmann::json;
  using ::testing::HasSubstr;

  namespace {
    Station station(const std::string& type, const std::string& base) {
      Station s;
      s.id = "st-1";
      s.name = "Bench 1";
      s.controllerType = type;
      s.controllerBaseUrl = base;
      return s;
    }

    Outlet outlet(const std::string& channel) {
      Outlet o;
      o.id = "out-" + channel;
      o.stationId = "st-1";
      o.label = "Outlet " + channel;
      o.controllerChannel = channel;
      return o;
    }
  } // namespace

  // ---- Shelly -------------------------------------------------------------

  class ShellyAdapterTest : public ::testing::Test {
  protected:
    void SetUp() override {
      http = std::make_shared<FakeHttpChannel>();
      adapter = std::make_unique<ShellyAdapter>(AdapterSettings{}, http);
    }

    std::shared_ptr<FakeHttpChannel> http;
    std::unique_ptr<ShellyAdapter> adapter;
    Station st = station(core::controller::kShellyGen2Http, "http://10.0.0.5/");
    Outlet out = outlet("2");
  };

  TEST_F(ShellyAdapterTest, turnOn_PostsSwitchSetForChannel) {
    http->responses["http://10.0.0.5/rpc/Switch.Set"] = { 200, R"({"was_on":false})" };

    adapter->turnOn(st, out);

    auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].url, "http://10.0.0.5/rpc/Switch.Set");
    EXPECT_EQ(json::parse(reqs[0].body), json({ { "id", 2 }, { "on", true } }));
    EXPECT_EQ(reqs[0].timeout, AdapterSettings{}.switchTimeout);
  }

  TEST_F(ShellyAdapterTest, turnOn_ThrowsOnNon2xx) {
    http->responses["http://10.0.0.5/rpc/Switch.Set"] = { 500, "boom" };
    EXPECT_THROW(adapter->turnOn(st, out), std::runtime_error);
  }

  TEST_F(ShellyAdapterTest, turnOff_NeverThrowsOnTransportFailure) {
    http->throw_message = "connection refused";
    EXPECT_NO_THROW(adapter->turnOff(st, out));
    EXPECT_EQ(json::parse(http->requests().at(0).body)["on"], false);
  }

  TEST_F(ShellyAdapterTest, getInstantReadings_MapsSwitchStatusFields) {
    http->responses["http://10.0.0.5/rpc/Switch.GetStatus"] = {
      200, R"({"id":2,"apower":1210.5,"voltage":121.2,"current":9.98,"temperature":{"tC":41.5}})"
    };

    auto r = adapter->getInstantReadings(st, out);
    EXPECT_DOUBLE_EQ(r.watts.value(), 1210.5);
    EXPECT_DOUBLE_EQ(r.volts.value(), 121.2);
    EXPECT_DOUBLE_EQ(r.amps.value(), 9.98);
    EXPECT_DOUBLE_EQ(r.tempC.value(), 41.5);
    EXPECT_FALSE(r.pressure);
    EXPECT_EQ(r.raw["id"], 2);
  }

  TEST_F(ShellyAdapterTest, getInstantReadings_RejectsNonNumericChannel) {
    EXPECT_THROW(adapter->getInstantReadings(st, outlet("left")), ConfigError);
  }

  TEST_F(ShellyAdapterTest, healthCheck_ReportsFailureInsteadOfThrowing) {
    http->throw_message = "timed out";
    auto h = adapter->healthCheck(st);
    EXPECT_FALSE(h.ok);
    EXPECT_THAT(h.details["error"].get<std::string>(), HasSubstr("timed out"));

    http->throw_message.reset();
    http->responses["http://10.0.0.5/rpc/Shelly.GetStatus"] = {
      200, R"({"sys":{"uptime":3600,"available_updates":{}}})"
    };
    h = adapter->healthCheck(st);
    EXPECT_TRUE(h.ok);
    EXPECT_EQ(h.details["uptime"], 3600);
  }

  // ---- IoTaWatt -----------------------------------------------------------

  TEST(iotawatt_adapter, switching_IsANoOpThatNeverThrows) {
    auto http = std::make_shared<FakeHttpChannel>();
    http->throw_message = "must not be called";
    IoTaWattAdapter adapter(AdapterSettings{}, http);
    const auto st = station(core::controller::kIoTaWattHttp, "http://10.0.0.7");

    EXPECT_NO_THROW(adapter.turnOn(st, outlet("Bench_1")));
    EXPECT_NO_THROW(adapter.turnOff(st, outlet("Bench_1")));
    EXPECT_TRUE(http->requests().empty());
  }

  TEST(iotawatt_adapter, getInstantReadings_QueriesSelectedSeries) {
    auto http = std::make_shared<FakeHttpChannel>();
    http->responses["http://10.0.0.7/query"] = { 200, "[850.2,119.8,7.1]" };
    IoTaWattAdapter adapter(AdapterSettings{}, http);
    Outlet o = outlet("0");
    o.controllerChannel = "Bench_1";

    auto r = adapter.getInstantReadings(station(core::controller::kIoTaWattHttp, "http://10.0.0.7"), o);

    EXPECT_EQ(http->requests().at(0).url,
              "http://10.0.0.7/query?select=%5BBench_1.Watts%2CBench_1.Volts%2CBench_1.Amps%5D");
    EXPECT_DOUBLE_EQ(r.watts.value(), 850.2);
    EXPECT_DOUBLE_EQ(r.volts.value(), 119.8);
    EXPECT_DOUBLE_EQ(r.amps.value(), 7.1);
    EXPECT_EQ(r.raw["channel"], "Bench_1");
  }

  TEST(iotawatt_adapter, getInstantReadings_ThrowsOnNonArrayReply) {
    auto http = std::make_shared<FakeHttpChannel>();
    http->responses["http://10.0.0.7/query"] = { 200, R"({"error":"unknown series"})" };
    IoTaWattAdapter adapter(AdapterSettings{}, http);
    EXPECT_THROW(adapter.getInstantReadings(station(core::controller::kIoTaWattHttp, "http://10.0.0.7"),
                                            outlet("Bench_9")),
                 std::runtime_error);
  }

  // ---- SNMP PDU -----------------------------------------------------------

  class SnmpPduAdapterTest : public ::testing::Test {
  protected:
    void SetUp() override {
      snmp = std::make_shared<FakeSnmpChannel>();
      adapter = std::make_unique<SnmpPduAdapter>(AdapterSettings{}, snmp);
    }

    std::shared_ptr<FakeSnmpChannel> snmp;
    std::unique_ptr<SnmpPduAdapter> adapter;
    Station st = station(core::controller::kSnmpPdu, "http://10.0.0.9:1161/");
    Outlet out = outlet("5");
  };

  TEST_F(SnmpPduAdapterTest, turnOnAndOff_SetOutletControlWithWriteCommunity) {
    adapter->turnOn(st, out);
    adapter->turnOff(st, out);

    ASSERT_EQ(snmp->sets.size(), 2u);
    EXPECT_EQ(snmp->sets[0].oid, std::string(SnmpPduAdapter::kOidOutletControl) + ".5");
    EXPECT_EQ(snmp->sets[0].value, SnmpPduAdapter::kOutletOn);
    EXPECT_EQ(snmp->sets[1].value, SnmpPduAdapter::kOutletOff);
    EXPECT_EQ(snmp->sets[0].target.host, "10.0.0.9");
    EXPECT_EQ(snmp->sets[0].target.port, 1161);
    EXPECT_EQ(snmp->sets[0].target.community, "private");
  }

  TEST_F(SnmpPduAdapterTest, getInstantReadings_ConvertsBankCurrentTenths) {
    snmp->table[std::string(SnmpPduAdapter::kOidOutletStatus) + ".5"] = FakeSnmpChannel::integer(1);
    snmp->table[std::string(SnmpPduAdapter::kOidBankCurrent) + ".1"] = FakeSnmpChannel::integer(87);

    auto r = adapter->getInstantReadings(st, out);
    EXPECT_DOUBLE_EQ(r.amps.value(), 8.7);
    EXPECT_FALSE(r.watts);
    EXPECT_EQ(r.raw["outletState"], "on");
    EXPECT_EQ(r.raw["bankCurrent"], 87);
    EXPECT_EQ(snmp->get_targets.at(0).community, "public");
  }

  TEST_F(SnmpPduAdapterTest, turnOffAndHealthCheck_SwallowAgentFailures) {
    snmp->throw_message = "timed out";
    EXPECT_THROW(adapter->turnOn(st, out), std::runtime_error);
    EXPECT_NO_THROW(adapter->turnOff(st, out));
    EXPECT_FALSE(adapter->healthCheck(st).ok);
  }

  TEST_F(SnmpPduAdapterTest, healthCheck_ReadsSysName) {
    snmp->table[SnmpPduAdapter::kOidSysName] = FakeSnmpChannel::text("rack-pdu-3");
    auto h = adapter->healthCheck(st);
    EXPECT_TRUE(h.ok);
    EXPECT_EQ(h.details["sysName"], "rack-pdu-3");
  }

  TEST_F(SnmpPduAdapterTest, badPortInBaseAddress_IsAConfigError) {
    EXPECT_THROW(adapter->turnOn(station(core::controller::kSnmpPdu, "10.0.0.9:notaport"), out),
                 ConfigError);
  }

  // ---- Manual -------------------------------------------------------------

  TEST(manual_adapter, everyOperation_IsOperatorMediated) {
    ManualAdapter adapter;
    const auto st = station(core::controller::kManual, "");
    const auto o = outlet("1");

    EXPECT_NO_THROW(adapter.turnOn(st, o));
    EXPECT_NO_THROW(adapter.turnOff(st, o));

    auto r = adapter.getInstantReadings(st, o);
    EXPECT_FALSE(r.watts);
    EXPECT_FALSE(r.amps);
    EXPECT_EQ(r.raw["source"], "manual");
    EXPECT_TRUE(adapter.healthCheck(st).ok);
  }

  // ---- AdapterFactory -----------------------------------------------------

  TEST(adapter_factory, withBuiltins_ResolvesEveryControllerType) {
    auto factory = AdapterFactory::withBuiltins(AdapterSettings{});
    EXPECT_EQ(factory.create(core::controller::kShellyGen2Http)->name(), "Shelly Gen2 (HTTP)");
    EXPECT_EQ(factory.create(core::controller::kIoTaWattHttp)->name(), "IoTaWatt (HTTP)");
    EXPECT_EQ(factory.create(core::controller::kSnmpPdu)->name(), "SNMP PDU");
    EXPECT_EQ(factory.create(core::controller::kManual)->name(), "Manual");
  }

  TEST(adapter_factory, create_UnknownTypeIsAConfigError) {
    auto factory = AdapterFactory::withBuiltins(AdapterSettings{});
    try {
      factory.create("ZIGBEE_PLUG");
      ADD_FAILURE() << "expected ConfigError";
    } catch (const ConfigError& e) {
      EXPECT_THAT(e.what(), HasSubstr("ZIGBEE_PLUG"));
    }
  }

  TEST(adapter_factory, forStation_RequiresAddressExceptForManual) {
    auto factory = AdapterFactory::withBuiltins(AdapterSettings{});
    EXPECT_THROW(factory.forStation(station(core::controller::kShellyGen2Http, "")), ConfigError);
    EXPECT_NO_THROW(factory.forStation(station(core::controller::kManual, "")));
  }

  TEST(adapter_factory, forStation_AcceptsOnlyNumericControllerAddresses) {
    auto factory = AdapterFactory::withBuiltins(AdapterSettings{});
    try {
      factory.forStation(station(core::controller::kShellyGen2Http, "http://shelly-plug.local"));
      ADD_FAILURE() << "expected ConfigError";
    } catch (const ConfigError& e) {
      EXPECT_THAT(e.what(), HasSubstr("numeric IP address"));
    }
    EXPECT_THROW(factory.forStation(station(core::controller::kSnmpPdu, "pdu-rack-3:161")),
                 ConfigError);
    EXPECT_THROW(factory.forStation(station(core::controller::kIoTaWattHttp, "http://[iotawatt]")),
                 ConfigError);

    EXPECT_NO_THROW(factory.forStation(station(core::controller::kShellyGen2Http, "http://10.0.0.5:8080/")));
    EXPECT_NO_THROW(factory.forStation(station(core::controller::kSnmpPdu, "udp://10.0.0.9:161")));
    EXPECT_NO_THROW(factory.forStation(station(core::controller::kSnmpPdu, "fd00::9")));
    EXPECT_NO_THROW(factory.forStation(station(core::controller::kIoTaWattHttp, "http://[fd00::7]:80")));
    EXPECT_NO_THROW(factory.forStation(station(core::controller::kManual, "front-desk")));
  }

  TEST(adapter_factory, registerAdapter_RejectsDuplicates) {
    AdapterFactory factory;
    EXPECT_TRUE(factory.registerAdapter("X", [] { return std::make_shared<ManualAdapter>(); }));
    EXPECT_FALSE(factory.registerAdapter("X", [] { return std::make_shared<ManualAdapter>(); }));
    EXPECT_TRUE(factory.knows("X"));
  }

} // namespace benchguard::test
