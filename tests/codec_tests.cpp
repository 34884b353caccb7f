/**
 * @file codec_tests.cpp
 * @brief modbusconf source file.
 */

#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "modbusconf/codec/config_document.hpp"
#include "modbusconf/codec/format_codec.hpp"
#include "modbusconf/codec/function_code_map.hpp"
#include "modbusconf/core/config_errors.hpp"

namespace {

template <typename Error, typename Fn>
std::string expectThrow(Fn&& fn) {
    try {
        fn();
    } catch (const Error& ex) {
        return ex.what();
    }
    assert(false && "expected exception");
    return {};
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

mbc::CanonicalController makeController() {
    mbc::CanonicalController controller;
    controller.name = "Boiler Room";
    controller.host = "10.0.0.5";
    controller.port = 502;
    controller.timeoutSeconds = 5;
    return controller;
}

mbc::CanonicalPoint makePoint(const std::string& name, mbc::PointKind kind, mbc::PointEncoding encoding,
                              std::uint32_t address, std::uint32_t unitId = 1) {
    mbc::CanonicalPoint point;
    point.name = name;
    point.kind = kind;
    point.encoding = encoding;
    point.address = address;
    point.unitId = unitId;
    point.capability.writable = mbc::isWritableKind(kind);
    return point;
}

// Serialize and re-read the document the way an import would see it.
mbc::DecodedConfig throughJson(const mbc::FormatCodec& codec, const mbc::ConfigDocument& document,
                               mbc::DecodePolicy policy = mbc::DecodePolicy::Strict) {
    const auto text = mbc::ConfigDocumentJson::serialize(mbc::ConfigDocumentJson::toJson(document));
    const auto root = mbc::ConfigDocumentJson::parse(text);
    return codec.decode(mbc::ConfigDocumentJson::fromJson(root, mbc::dialectOf(document)), policy);
}

const mbc::CanonicalPoint* findAt(const mbc::DecodedConfig& decoded, mbc::PointKind kind,
                                  std::uint32_t address) {
    for (const auto& incoming : decoded.points) {
        if (incoming.ok() && incoming.point->kind == kind && incoming.point->address == address) {
            return &*incoming.point;
        }
    }
    return nullptr;
}

void testFunctionCodeMap() {
    using mbc::FunctionCode;
    using mbc::FunctionCodeMap;
    using mbc::PointKind;

    static_assert(FunctionCodeMap::isComplete());
    static_assert(FunctionCodeMap::readCode(PointKind::Coil) == FunctionCode::ReadCoils);
    static_assert(FunctionCodeMap::readCode(PointKind::InputRegister) == FunctionCode::ReadInputRegisters);

    assert(FunctionCodeMap::lookup(2)->kind == PointKind::DiscreteInput);
    assert(FunctionCodeMap::lookup(16)->kind == PointKind::HoldingRegister);
    assert(FunctionCodeMap::lookup(16)->access == mbc::PointAccess::Write);
    assert(!FunctionCodeMap::lookup(7).has_value());
    assert(!FunctionCodeMap::lookup(99).has_value());

    assert(*FunctionCodeMap::writeCode(PointKind::Coil) == FunctionCode::WriteSingleCoil);
    assert(*FunctionCodeMap::writeCode(PointKind::Coil, 8) == FunctionCode::WriteMultipleCoils);
    assert(*FunctionCodeMap::writeCode(PointKind::HoldingRegister, 2) == FunctionCode::WriteMultipleRegisters);
    assert(!FunctionCodeMap::writeCode(PointKind::InputRegister).has_value());
    assert(!FunctionCodeMap::writeCode(PointKind::DiscreteInput).has_value());
}

void testNativeRoundTrip() {
    const mbc::FormatCodec codec;
    auto temp = makePoint("temp", mbc::PointKind::HoldingRegister, mbc::PointEncoding::Float32, 100);
    temp.length = 2;
    temp.formula = "x*0.1";
    temp.unit = "C";
    temp.minValue = -40.0;
    temp.maxValue = 120.0;
    temp.description = "supply temperature";
    auto pump = makePoint("pump", mbc::PointKind::Coil, mbc::PointEncoding::Bool, 5, 2);
    pump.capability.writable = false;
    const auto level = makePoint("level", mbc::PointKind::InputRegister, mbc::PointEncoding::Int16, 30);

    const auto decoded = throughJson(codec, codec.encode(makeController(), {temp, pump, level},
                                                         mbc::ConfigDialect::Native, "2026-01-01T00:00:00Z"));
    assert(decoded.controller.name == "Boiler Room");
    assert(decoded.controller.host == "10.0.0.5");
    assert(decoded.controller.port == 502);
    assert(decoded.controller.timeoutSeconds == 5);
    assert(decoded.points.size() == 3U);

    const auto& t = decoded.points[0].require();
    assert(t.name == "temp");
    assert(t.kind == mbc::PointKind::HoldingRegister);
    assert(t.encoding == mbc::PointEncoding::Float32);
    assert(t.address == 100U && t.length == 2U && t.unitId == 1U);
    assert(t.formula == std::optional<std::string>("x*0.1"));
    assert(t.unit == std::optional<std::string>("C"));
    assert(t.minValue == -40.0 && t.maxValue == 120.0);
    assert(t.description == std::optional<std::string>("supply temperature"));
    assert(t.capability.writable);

    const auto& p = decoded.points[1].require();
    assert(p.unitId == 2U);
    assert(!p.capability.writable);

    const auto& l = decoded.points[2].require();
    assert(l.encoding == mbc::PointEncoding::Int16);
    assert(!l.capability.writable);
    assert(!l.formula.has_value());

    const auto empty = throughJson(codec, codec.encode(makeController(), {}, mbc::ConfigDialect::Native));
    assert(empty.points.empty());
    assert(empty.controller.port == 502);
}

void testNativeWriteDemotionAndDefaults() {
    mbc::NativeDocument document;
    document.controller = {"plc", "192.168.1.10", 502, std::nullopt};
    mbc::NativePoint sensor;
    sensor.name = "sensor";
    sensor.kind = mbc::PointKind::InputRegister;
    sensor.encoding = mbc::PointEncoding::UInt16;
    sensor.address = 7;
    sensor.writable = true;
    mbc::NativePoint valve;
    valve.name = "valve";
    valve.kind = mbc::PointKind::Coil;
    valve.encoding = mbc::PointEncoding::Bool;
    valve.address = 3;
    document.points = {sensor, valve};

    const mbc::FormatCodec codec;
    const auto decoded = codec.decode(document);
    assert(decoded.controller.timeoutSeconds == 10);
    const auto& s = decoded.points[0].require();
    assert(!s.capability.writable);
    assert(s.capability.readable);
    assert(s.length == 1U && s.unitId == 1U);
    assert(decoded.points[1].require().capability.writable);
}

void testNativeOutOfRangePoint() {
    mbc::NativeDocument document;
    document.controller = {"plc", "192.168.1.10", 502, 3};
    mbc::NativePoint far;
    far.name = "far";
    far.address = 70000;
    mbc::NativePoint near;
    near.name = "near";
    near.address = 1;
    document.points = {far, near};

    const mbc::FormatCodec codec;
    const auto message = expectThrow<mbc::ConfigProcessingError>([&] { codec.decode(document); });
    assert(contains(message, "far"));

    const auto lenient = codec.decode(document, mbc::DecodePolicy::Lenient);
    assert(lenient.points.size() == 2U);
    assert(!lenient.points[0].ok());
    assert(lenient.points[0].name == "far");
    assert(contains(lenient.points[0].error, "address"));
    assert(lenient.points[1].ok());
}

void testGatewayRoundTrip() {
    const mbc::FormatCodec codec;
    const auto setpoint = makePoint("setpoint", mbc::PointKind::HoldingRegister, mbc::PointEncoding::UInt16, 100);
    const auto alarm = makePoint("alarm", mbc::PointKind::DiscreteInput, mbc::PointEncoding::Bool, 3);
    const auto fan = makePoint("fan", mbc::PointKind::Coil, mbc::PointEncoding::Bool, 7);
    auto energy = makePoint("energy", mbc::PointKind::InputRegister, mbc::PointEncoding::Int32, 200);
    energy.length = 2;

    const auto document = codec.encode(makeController(), {setpoint, alarm, fan, energy},
                                       mbc::ConfigDialect::Gateway, "2026-01-01T00:00:00Z");
    const auto root = mbc::ConfigDocumentJson::toJson(document);
    assert(root["format"].asString() == "gateway");
    const auto& slaves = root["master"]["slaves"];
    assert(slaves.size() == 1U);
    assert(slaves[0]["deviceName"].asString() == "Boiler Room");
    assert(slaves[0]["deviceType"].asString() == "boiler_room");
    assert(slaves[0]["unitId"].asInt() == 1);
    assert(slaves[0]["attributes"].size() == 2U);
    assert(slaves[0]["timeseries"].size() == 2U);
    assert(slaves[0]["rpc"].size() == 2U);
    assert(slaves[0]["attributes"][0]["type"].asString() == "bits");
    assert(slaves[0]["rpc"][0]["tag"].asString() == "set_setpoint");
    assert(slaves[0]["rpc"][0]["functionCode"].asInt() == 6);
    assert(slaves[0]["rpc"][0]["objectsCount"].asInt() == 1);
    assert(slaves[0]["rpc"][1]["tag"].asString() == "set_fan");
    assert(slaves[0]["rpc"][1]["functionCode"].asInt() == 5);
    assert(!slaves[0]["rpc"][1].isMember("objectsCount"));

    const auto decoded = throughJson(codec, document);
    assert(decoded.points.size() == 4U);

    const auto* s = findAt(decoded, mbc::PointKind::HoldingRegister, 100);
    assert(s != nullptr);
    assert(s->name == "setpoint");
    assert(s->capability.readable && s->capability.writable);

    const auto* a = findAt(decoded, mbc::PointKind::DiscreteInput, 3);
    assert(a != nullptr && !a->capability.writable);
    assert(a->encoding == mbc::PointEncoding::Bool);

    const auto* f = findAt(decoded, mbc::PointKind::Coil, 7);
    assert(f != nullptr && f->capability.writable);

    const auto* e = findAt(decoded, mbc::PointKind::InputRegister, 200);
    assert(e != nullptr && !e->capability.writable);
    assert(e->encoding == mbc::PointEncoding::Int32);
    assert(e->length == 2U);
}

void testGatewayMultiRegisterWrite() {
    const mbc::FormatCodec codec;
    auto block = makePoint("block", mbc::PointKind::HoldingRegister, mbc::PointEncoding::Float64, 10);
    block.length = 4;
    const auto document = std::get<mbc::GatewayDocument>(
        codec.encode(makeController(), {block}, mbc::ConfigDialect::Gateway));
    const auto& rpc = document.slaves[0].rpc;
    assert(rpc.size() == 1U);
    assert(rpc[0].functionCode == 16);
    assert(rpc[0].objectsCount == std::optional<std::int64_t>(4));
}

void testGatewayGroupsByUnitAndEmptyExport() {
    const mbc::FormatCodec codec;
    const auto a = makePoint("a", mbc::PointKind::HoldingRegister, mbc::PointEncoding::UInt16, 1, 3);
    const auto b = makePoint("b", mbc::PointKind::HoldingRegister, mbc::PointEncoding::UInt16, 1, 2);
    const auto grouped = std::get<mbc::GatewayDocument>(
        codec.encode(makeController(), {a, b}, mbc::ConfigDialect::Gateway));
    assert(grouped.slaves.size() == 2U);
    assert(grouped.slaves[0].unitId == std::optional<std::int64_t>(2));
    assert(grouped.slaves[1].unitId == std::optional<std::int64_t>(3));

    const auto empty = std::get<mbc::GatewayDocument>(
        codec.encode(makeController(), {}, mbc::ConfigDialect::Gateway));
    assert(empty.slaves.size() == 1U);
    assert(empty.slaves[0].unitId == std::optional<std::int64_t>(1));
    assert(empty.slaves[0].attributes.empty() && empty.slaves[0].rpc.empty());
}

mbc::GatewayDocument singleSlave() {
    mbc::GatewayDocument document;
    mbc::GatewaySlave slave;
    slave.host = "10.0.0.9";
    slave.port = 5020;
    slave.unitId = 4;
    slave.deviceName = "Chiller";
    document.slaves.push_back(slave);
    return document;
}

void testGatewayTagMerge() {
    auto document = singleSlave();
    auto& slave = document.slaves[0];
    slave.timeseries.push_back({"temp", "int16", 3, 100, std::nullopt});
    slave.rpc.push_back({"set_temp", "int16", 6, 100, 1});
    slave.timeseries.push_back({"raw", "", 3, 5, std::nullopt});
    slave.rpc.push_back({"set_setpoint", "uint16", 6, 5, std::nullopt});
    slave.attributes.push_back({"door", "", 2, 8, std::nullopt});
    slave.timeseries.push_back({"counter", "bytes", 4, 9, std::nullopt});

    const mbc::FormatCodec codec;
    const auto decoded = codec.decode(document);
    assert(decoded.controller.name == "Chiller");
    assert(decoded.controller.port == 5020);
    assert(decoded.points.size() == 4U);

    const auto* temp = findAt(decoded, mbc::PointKind::HoldingRegister, 100);
    assert(temp != nullptr);
    assert(temp->name == "temp");
    assert(temp->unitId == 4U);
    assert(temp->encoding == mbc::PointEncoding::Int16);
    assert(temp->capability.readable && temp->capability.writable);

    const auto* renamed = findAt(decoded, mbc::PointKind::HoldingRegister, 5);
    assert(renamed != nullptr);
    assert(renamed->name == "setpoint");
    assert(renamed->encoding == mbc::PointEncoding::UInt16);

    const auto* door = findAt(decoded, mbc::PointKind::DiscreteInput, 8);
    assert(door != nullptr && door->encoding == mbc::PointEncoding::Bool);

    const auto* counter = findAt(decoded, mbc::PointKind::InputRegister, 9);
    assert(counter != nullptr && counter->encoding == mbc::PointEncoding::UInt16);
}

void testGatewayPointFailures() {
    auto document = singleSlave();
    document.slaves[0].timeseries.push_back({"weird", "decimal", 3, 1, std::nullopt});
    document.slaves[0].timeseries.push_back({"unmapped", "uint16", 99, 2, std::nullopt});
    document.slaves[0].timeseries.push_back({"good", "uint16", 3, 3, std::nullopt});

    const mbc::FormatCodec codec;
    const auto message = expectThrow<mbc::ConfigProcessingError>([&] { codec.decode(document); });
    assert(contains(message, "weird"));

    const auto decoded = codec.decode(document, mbc::DecodePolicy::Lenient);
    assert(decoded.points.size() == 3U);
    std::size_t failed = 0;
    for (const auto& incoming : decoded.points) {
        if (!incoming.ok()) {
            ++failed;
            assert(incoming.name == "weird" || incoming.name == "unmapped");
            expectThrow<mbc::ConfigProcessingError>([&] { incoming.require(); });
        }
    }
    assert(failed == 2U);
    assert(findAt(decoded, mbc::PointKind::HoldingRegister, 3) != nullptr);
}

void testGatewayRejectsMultipleSlaves() {
    auto document = singleSlave();
    document.slaves.push_back(document.slaves[0]);
    const mbc::FormatCodec codec;
    for (const auto policy : {mbc::DecodePolicy::Strict, mbc::DecodePolicy::Lenient}) {
        const auto message = expectThrow<mbc::DuplicateError>([&] { codec.decode(document, policy); });
        assert(contains(message, "single-controller"));
    }
}

void testGatewayDropsWriteOnReadOnlyKinds() {
    auto document = singleSlave();
    auto& slave = document.slaves[0];
    slave.timeseries.push_back({"level", "uint16", 4, 12, std::nullopt});
    slave.rpc.push_back({"set_level", "uint16", 4, 12, std::nullopt});
    slave.rpc.push_back({"set_alarm", "bits", 2, 3, std::nullopt});

    const mbc::FormatCodec codec;
    const auto decoded = codec.decode(document);
    assert(decoded.points.size() == 2U);

    const auto* level = findAt(decoded, mbc::PointKind::InputRegister, 12);
    assert(level != nullptr);
    assert(level->name == "level");
    assert(level->capability.readable);
    assert(!level->capability.writable);

    const auto* alarm = findAt(decoded, mbc::PointKind::DiscreteInput, 3);
    assert(alarm != nullptr);
    assert(alarm->name == "alarm");
    assert(alarm->capability.readable);
    assert(!alarm->capability.writable);
}

void testGatewayRpcWireTypeIgnoredAfterRead() {
    auto document = singleSlave();
    document.slaves[0].timeseries.push_back({"temp", "int16", 3, 100, std::nullopt});
    document.slaves[0].rpc.push_back({"set_temp", "decimal", 6, 100, std::nullopt});

    const mbc::FormatCodec codec;
    const auto decoded = codec.decode(document, mbc::DecodePolicy::Lenient);
    assert(decoded.points.size() == 1U);
    const auto& temp = decoded.points[0].require();
    assert(temp.encoding == mbc::PointEncoding::Int16);
    assert(temp.capability.writable);

    // Without a read entry the rpc label decides, so it is still checked.
    auto rpcOnly = singleSlave();
    rpcOnly.slaves[0].rpc.push_back({"set_temp", "decimal", 6, 100, std::nullopt});
    const auto failed = codec.decode(rpcOnly, mbc::DecodePolicy::Lenient);
    assert(failed.points.size() == 1U);
    assert(!failed.points[0].ok());
}

void testGatewayFunctionCodeOutOfIntRange() {
    const auto root = mbc::ConfigDocumentJson::parse(R"({"master": {"slaves": [{
        "host": "h", "port": 502, "deviceName": "d",
        "timeseries": [{"tag": "t", "functionCode": 4294967299, "address": 1}]}]}})");
    const auto message = expectThrow<mbc::ConfigFormatError>(
        [&] { mbc::ConfigDocumentJson::fromJson(root, mbc::ConfigDialect::Gateway); });
    assert(contains(message, "functionCode"));
}

void testDialectNames() {
    assert(mbc::parseConfigDialect("native") == mbc::ConfigDialect::Native);
    assert(mbc::parseConfigDialect("gateway") == mbc::ConfigDialect::Gateway);
    assert(mbc::parseConfigDialect("thingsboard") == mbc::ConfigDialect::Gateway);
    assert(!mbc::parseConfigDialect("xml").has_value());
    const auto message = expectThrow<mbc::ConfigFormatError>([] { mbc::requireConfigDialect("xml"); });
    assert(contains(message, "xml"));
    expectThrow<mbc::ConfigFormatError>([] { mbc::ConfigDocumentJson::parse("{ \"controller\": "); });
}

} // namespace

int main() {
    testFunctionCodeMap();
    testNativeRoundTrip();
    testNativeWriteDemotionAndDefaults();
    testNativeOutOfRangePoint();
    testGatewayRoundTrip();
    testGatewayMultiRegisterWrite();
    testGatewayGroupsByUnitAndEmptyExport();
    testGatewayTagMerge();
    testGatewayPointFailures();
    testGatewayRejectsMultipleSlaves();
    testGatewayDropsWriteOnReadOnlyKinds();
    testGatewayRpcWireTypeIgnoredAfterRead();
    testGatewayFunctionCodeOutOfIntRange();
    testDialectNames();

    std::cout << "codec_tests passed\n";
    return 0;
}
