#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "BatchEmitter.hpp"
#include "Compressor.hpp"
#include "FileRecordSink.hpp"
#include "MemoryRecordSink.hpp"
#include "NullSink.hpp"
#include "RecordFormatter.hpp"
#include "SinkFactory.hpp"
#include "TelgenErrors.hpp"

namespace fs = std::filesystem;

TableSchema test_schema() {
    return TableSchema(TableKind::Syslog, {
        FieldSpec::text("message"),
        FieldSpec::integer("count"),
        FieldSpec::real("ratio", 0.0, 1.0, true),
        FieldSpec::boolean("anomaly")
    });
}

Record make_record(int64_t i, const std::string& message) {
    Record r;
    r.table = TableKind::Syslog;
    r.common.timestamp = 1740787200 + i;
    r.common.module_id = "Cisco-DC1-Pod01-Rack01-leaf-001-Ethernet1/1-100G";
    r.common.datacenter = "DC1";
    r.common.room = "Pod01";
    r.common.rack = "Rack01";
    r.common.device_hostname = "leaf-001";
    r.common.device_ip = "10.0.0.1";
    r.common.device_vendor = "Cisco";
    r.common.interface = "Ethernet1/1";
    r.common.speed = "100G";
    r.values = {FieldValue(message), FieldValue(i), i % 2 ? FieldValue(0.25) : FieldValue(std::monostate{}),
                FieldValue(i % 3 == 0)};
    return r;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("telgen_sink_" + name);
    fs::remove_all(dir);
    return dir;
}

void test_csv_escape() {
    assert(RecordFormatter::csv_escape("plain") == "plain");
    assert(RecordFormatter::csv_escape("a,b") == "\"a,b\"");
    assert(RecordFormatter::csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    assert(RecordFormatter::csv_escape("two\nlines") == "\"two\nlines\"");
    std::cout << "test_csv_escape passed\n";
}

void test_csv_line() {
    TableSchema schema = test_schema();
    std::string header = RecordFormatter::csv_header(schema);
    assert(header.rfind("timestamp,module_id,datacenter", 0) == 0);
    assert(header.find(",message,count,ratio,anomaly") != std::string::npos);

    std::string line = RecordFormatter::csv_line(make_record(0, "link down, port 1"));
    assert(line.rfind("2025-03-01 00:00:00,Cisco-DC1-", 0) == 0);
    assert(line.find(",\"link down, port 1\",0,,true") != std::string::npos);

    std::string odd = RecordFormatter::csv_line(make_record(1, "ok"));
    assert(odd.find(",ok,1,0.25,false") != std::string::npos);
    std::cout << "test_csv_line passed\n";
}

void test_json_object() {
    TableSchema schema = test_schema();
    auto json = RecordFormatter::to_json(schema, make_record(3, "hello"));
    assert(json.begin().key() == "timestamp");
    assert(json["timestamp"] == "2025-03-01 00:00:03");
    assert(json["count"] == 3);
    assert(json["ratio"].is_null() == false);
    assert(json["anomaly"] == true);

    auto even = RecordFormatter::to_json(schema, make_record(4, "x"));
    assert(even["ratio"].is_null());
    std::cout << "test_json_object passed\n";
}

void test_file_sink_csv() {
    fs::path dir = scratch_dir("csv");
    OutputConfig config;
    config.directory = dir.string();
    TableSchema schema = test_schema();

    FileRecordSink sink(config, "syslog_data");
    assert(sink.location() == (dir / "syslog_data.csv").string());
    sink.open(schema);
    sink.emit({make_record(0, "a"), make_record(1, "b")});
    sink.emit({make_record(2, "c")});
    sink.finish("syslog");

    std::string text = read_file(sink.location());
    size_t lines = 0;
    for (char c : text) lines += (c == '\n');
    assert(lines == 4);
    assert(text.rfind(RecordFormatter::csv_header(schema) + "\n", 0) == 0);
    assert(sink.rows_written() == 3);
    fs::remove_all(dir);
    std::cout << "test_file_sink_csv passed\n";
}

void test_file_sink_compressed_jsonl() {
    fs::path dir = scratch_dir("zst");
    OutputConfig config;
    config.directory = dir.string();
    config.format = OutputFormat::JsonLines;
    config.compression = CompressionType::ZSTD;
    TableSchema schema = test_schema();

    FileRecordSink sink(config, "ddm_data");
    assert(sink.location() == (dir / "ddm_data.jsonl.zst").string());
    sink.open(schema);
    for (int b = 0; b < 3; ++b) {
        RecordBatch batch;
        for (int i = 0; i < 10; ++i) batch.push_back(make_record(b * 10 + i, "m"));
        sink.emit(batch);
    }
    sink.finish("ddm");

    std::string text = Compressor::decompress(read_file(sink.location()), CompressionType::ZSTD);
    std::istringstream in(text);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        auto json = nlohmann::json::parse(line);
        assert(json["count"] == count);
        ++count;
    }
    assert(count == 30);
    fs::remove_all(dir);
    std::cout << "test_file_sink_compressed_jsonl passed\n";
}

void test_file_sink_errors() {
    OutputConfig config;
    config.directory = "/proc/telgen-cannot-write-here";
    FileRecordSink sink(config, "grpc_data");
    TableSchema schema = test_schema();
    bool caught = false;
    try {
        sink.open(schema);
    } catch (const std::runtime_error&) {
        caught = true;
    }
    (void)caught;
    assert(caught);

    caught = false;
    try {
        sink.emit({make_record(0, "a")});
    } catch (const std::logic_error&) {
        caught = true;
    }
    assert(caught);
    std::cout << "test_file_sink_errors passed\n";
}

void test_batch_emitter_batches() {
    TableSchema schema = test_schema();
    MemoryRecordSink sink;
    BatchEmitter emitter(sink, schema, 4);
    emitter.open();
    for (int i = 0; i < 10; ++i) {
        emitter.add(make_record(i, "r"));
    }
    emitter.finish();

    assert(sink.open_calls == 1);
    assert(sink.finish_calls == 1);
    assert(sink.finished_table == "syslog");
    assert(sink.records.size() == 10);
    assert((sink.batch_sizes == std::vector<size_t>{4, 4, 2}));
    assert(emitter.batches_emitted() == 3);
    assert(emitter.last_batch_index() == 2);
    assert(emitter.rows_emitted() == 10);
    std::cout << "test_batch_emitter_batches passed\n";
}

void test_batch_emitter_zero_rows() {
    TableSchema schema = test_schema();
    MemoryRecordSink sink;
    BatchEmitter emitter(sink, schema);
    emitter.open();
    emitter.finish();
    assert(sink.finish_calls == 1);
    assert(sink.batch_count == 0);
    assert(emitter.last_batch_index() == -1);
    std::cout << "test_batch_emitter_zero_rows passed\n";
}

void test_batch_emitter_wraps_failures() {
    TableSchema schema = test_schema();
    MemoryRecordSink sink("failing", 2);
    BatchEmitter emitter(sink, schema, 3);
    emitter.open();

    bool caught = false;
    try {
        for (int i = 0; i < 20; ++i) {
            emitter.add(make_record(i, "r"));
        }
    } catch (const SinkWriteError& e) {
        caught = true;
        assert(e.table() == "syslog");
        assert(e.last_batch_index() == 1);
    }
    (void)caught;
    assert(caught);
    // Emitted batches are kept
    assert(sink.records.size() == 6);

    MemoryRecordSink first("first", 0);
    BatchEmitter early(first, schema, 3);
    early.open();
    early.add(make_record(0, "r"));
    caught = false;
    try {
        early.finish();
    } catch (const SinkWriteError& e) {
        caught = e.last_batch_index() == -1;
    }
    assert(caught);
    std::cout << "test_batch_emitter_wraps_failures passed\n";
}

void test_batch_emitter_abandon() {
    TableSchema schema = test_schema();
    MemoryRecordSink sink;
    BatchEmitter emitter(sink, schema, 4);
    emitter.open();
    for (int i = 0; i < 6; ++i) emitter.add(make_record(i, "r"));
    emitter.abandon();
    assert(sink.records.size() == 4);
    assert(sink.finish_calls == 1);
    assert(emitter.finished());
    std::cout << "test_batch_emitter_abandon passed\n";
}

void test_null_sink_and_factory() {
    auto sink = SinkFactory::create_null_sink();
    TableSchema schema = test_schema();
    BatchEmitter emitter(*sink, schema, 2);
    emitter.open();
    for (int i = 0; i < 5; ++i) emitter.add(make_record(i, "r"));
    emitter.finish();
    auto* null_sink = dynamic_cast<NullSink*>(sink.get());
    assert(null_sink && null_sink->rows() == 5 && null_sink->finished());

    OutputConfig config;
    config.directory = "out";
    config.compression = CompressionType::GZIP;
    auto creator = SinkFactory::file_sinks(config);
    auto file = creator(TableRequest{TableKind::Snmp, true, "snmp_data"});
    assert(file->location() == (fs::path("out") / "snmp_data.csv.gz").string());
    std::cout << "test_null_sink_and_factory passed\n";
}

int main() {
    test_csv_escape();
    test_csv_line();
    test_json_object();
    test_file_sink_csv();
    test_file_sink_compressed_jsonl();
    test_file_sink_errors();
    test_batch_emitter_batches();
    test_batch_emitter_zero_rows();
    test_batch_emitter_wraps_failures();
    test_batch_emitter_abandon();
    test_null_sink_and_factory();
    std::cout << "All RecordSink tests passed\n";
    return 0;
}
