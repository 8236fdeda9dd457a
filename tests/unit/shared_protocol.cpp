#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rcctl/error_codes.hpp"
#include "rcctl/jobs.hpp"
#include "rcctl/protocol.hpp"

using namespace rcctl;
using namespace rcctl::protocol;
using namespace rcctl::jobs;

void run_client_component_tests();

namespace
{

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const RcError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    nlohmann::json status_payload(bool finished, bool success)
    {
        return {
            {"id", 7},
            {"startTime", "2023-05-01T10:00:00.123456789+02:00"},
            {"endTime", finished ? "2023-05-01T10:02:30.5+02:00" : "0001-01-01T00:00:00Z"},
            {"error", success ? "" : "copy failed"},
            {"output", {{"size", 10}}},
            {"finished", finished},
            {"success", success},
            {"duration", 150.5},
            {"group", "job/7"},
        };
    }

    void test_endpoint_names()
    {
        assert(to_string(Endpoint::JobStatus) == "job/status");
        assert(to_string(Endpoint::CoreStatsDelete) == "core/stats-delete");
        assert(to_string(Endpoint::OperationsCopyFile) == "operations/copyfile");
        assert(endpoint_from_string("job/list") == Endpoint::JobList);
        assert(endpoint_from_string("rc/noop") == Endpoint::RcNoop);
        assert(!endpoint_from_string("job/frobnicate").has_value());
        assert(job_stats_group(42) == "job/42");
    }

    void test_request_payloads()
    {
        const auto stop = nlohmann::json(JobIdRequest{.jobid = 12});
        assert(stop == (nlohmann::json{{"jobid", 12}}));
        assert(stop.get<JobIdRequest>().jobid == 12);

        const auto group = nlohmann::json(StatsGroupRequest{.group = job_stats_group(3)});
        assert(group.at("group") == "job/3");

        const auto copy = nlohmann::json(CopyFileRequest{
            .src_fs = "local:",
            .src_remote = "a/b.txt",
            .dst_fs = "remote:bucket",
            .dst_remote = "b.txt",
        });
        assert(copy.at("srcFs") == "local:");
        assert(copy.at("srcRemote") == "a/b.txt");
        assert(copy.at("dstFs") == "remote:bucket");
        assert(copy.at("dstRemote") == "b.txt");
        assert(copy.at("_async") == true);

        const auto sync_delete = nlohmann::json(DeleteFileRequest{.fs = "local:", .remote = "old.txt", .async = false});
        assert(!sync_delete.contains("_async"));

        const auto hashsum = nlohmann::json(HashsumRequest{.fs = "remote:", .hash_type = "md5"});
        assert(hashsum.at("hashType") == "md5");

        const auto path = nlohmann::json(PathRequest{.fs = "remote:", .remote = "dir"}).get<PathRequest>();
        assert(path.fs == "remote:");
        assert(path.remote == "dir");
    }

    void test_job_list_decoding()
    {
        const auto mixed = decode_payload<JobListResponse>(nlohmann::json{{"jobids", nlohmann::json::array({1, "2", 30})}}, "job/list");
        assert((mixed.jobids == std::vector<JobId>{1, 2, 30}));

        const auto none = decode_payload<JobListResponse>(nlohmann::json{{"jobids", nullptr}}, "job/list");
        assert(none.jobids.empty());

        assert(error_of([]
                        { decode_payload<JobListResponse>(nlohmann::json{{"jobids", nlohmann::json::array({"two"})}}, "job/list"); }) ==
               ErrorCode::MalformedPayload);
        assert(error_of([]
                        { decode_payload<JobListResponse>(nlohmann::json::object(), "job/list"); }) ==
               ErrorCode::MalformedPayload);

        const auto groups =
            decode_payload<GroupListResponse>(nlohmann::json{{"groups", nlohmann::json::array({"job/1", "job/2"})}}, "core/group-list");
        assert(groups.groups.size() == 2);
        assert(decode_payload<GroupListResponse>(nlohmann::json{{"groups", nullptr}}, "core/group-list").groups.empty());

        assert(decode_payload<AsyncJobResponse>(nlohmann::json{{"jobid", 99}}, "operations/copyfile").jobid == 99);
    }

    void test_config_dump_remotes()
    {
        const nlohmann::json dump = {
            {"gdrive", {{"type", "drive"}, {"scope", "drive"}}},
            {"backup", {{"type", "s3"}}},
        };
        const auto remotes = remotes_from_config_dump(dump);
        assert(remotes.size() == 2);
        assert(remotes[0].name == "backup:");
        assert(remotes[0].type == "s3");
        assert(remotes[1].name == "gdrive:");
        assert(remotes[1].type == "drive");

        assert(remotes_from_config_dump(nullptr).empty());
        assert(error_of([]
                        { remotes_from_config_dump(nlohmann::json::array()); }) == ErrorCode::MalformedPayload);
    }

    void test_daemon_error_body()
    {
        const auto body = nlohmann::json{{"error", "object not found"}, {"status", 404}, {"path", "operations/stat"}}
                              .get<DaemonErrorBody>();
        assert(body.error == "object not found");
        assert(body.status == 404);
        assert(body.path == "operations/stat");
    }

    void test_timestamp_normalization()
    {
        assert(normalize_timestamp("2023-05-01T10:00:00.123456+02:00") == "2023-05-01T10:00:00+02:00");
        assert(normalize_timestamp("2023-05-01T10:00:00.123456Z") == "2023-05-01T10:00:00");
        assert(normalize_timestamp("2023-05-01T10:00:00.5CEST") == "2023-05-01T10:00:00");
        assert(normalize_timestamp("2023-05-01T10:00:00-05:30") == "2023-05-01T10:00:00-05:30");
        assert(normalize_timestamp("2023-05-01T10:00:00") == "2023-05-01T10:00:00");

        using namespace std::chrono;
        const auto with_offset = parse_timestamp("2023-05-01T10:00:00.123456+02:00");
        assert(with_offset == parse_timestamp("2023-05-01T10:00:00+02:00"));
        assert(with_offset.utc_offset == minutes{120});
        assert(with_offset.to_utc() == sys_days{year{2023} / May / day{1}} + hours{8});
        assert(format_timestamp(with_offset) == "2023-05-01T10:00:00+02:00");

        const auto lettered = parse_timestamp("2023-05-01T10:00:00.123456Z");
        assert(!lettered.utc_offset.has_value());
        assert(!lettered.to_utc().has_value());
        assert(lettered.wall_time == sys_days{year{2023} / May / day{1}} + hours{10});
        assert(format_timestamp(lettered) == "2023-05-01T10:00:00");

        const auto negative = parse_timestamp("2023-12-31T23:59:59-05:30");
        assert(negative.utc_offset == minutes{-330});
        assert(format_timestamp(negative) == "2023-12-31T23:59:59-05:30");

        assert(error_of([]
                        { parse_timestamp("yesterday"); }) == ErrorCode::MalformedPayload);
        assert(error_of([]
                        { parse_timestamp("2023-02-30T10:00:00Z"); }) == ErrorCode::MalformedPayload);
        assert(error_of([]
                        { parse_timestamp("2023-05-01T24:00:00Z"); }) == ErrorCode::MalformedPayload);
    }

    void test_job_record_states()
    {
        struct Case
        {
            bool finished;
            bool success;
            JobState expected;
        };
        const Case cases[] = {
            {false, false, JobState::InProgress},
            {false, true, JobState::InProgress},
            {true, false, JobState::Failed},
            {true, true, JobState::Finished},
        };
        for (const auto &c : cases)
        {
            const auto record = decode_job_record(status_payload(c.finished, c.success));
            assert(record.id == 7);
            assert(record.finished == c.finished);
            assert(derive_state(record) == c.expected);
            assert(derive_state(std::optional<JobRecord>(record)) == c.expected);
            assert(record.end_time.has_value() == c.finished);
            assert(!record.stats.has_value());
        }

        assert(derive_state(std::optional<JobRecord>{}) == JobState::NotStarted);
        assert(is_terminal(JobState::Finished));
        assert(is_terminal(JobState::Failed));
        assert(!is_terminal(JobState::InProgress));
        assert(!is_terminal(JobState::NotStarted));
        assert(to_string(JobState::NotStarted) == "NOT_STARTED");
        assert(to_string(JobState::Failed) == "FAILED");

        const auto failed = decode_job_record(status_payload(true, false));
        assert(failed.error == "copy failed");
        assert(failed.output.at("size") == 10);
        assert(failed.end_time->utc_offset == std::chrono::minutes{120});
    }

    void test_job_record_rejects_incomplete_payloads()
    {
        for (const char *field : {"id", "startTime", "endTime", "finished", "success"})
        {
            auto payload = status_payload(true, true);
            payload.erase(std::string(field));
            assert(error_of([&]
                            { decode_job_record(payload); }) == ErrorCode::MalformedPayload);
        }

        auto bad_time = status_payload(false, false);
        bad_time["startTime"] = "not a time";
        assert(error_of([&]
                        { decode_job_record(bad_time); }) == ErrorCode::MalformedPayload);

        auto bad_flag = status_payload(true, true);
        bad_flag["finished"] = "yes";
        assert(error_of([&]
                        { decode_job_record(bad_flag); }) == ErrorCode::MalformedPayload);

        assert(error_of([]
                        { decode_job_record(nlohmann::json::array()); }) == ErrorCode::MalformedPayload);

        auto null_end = status_payload(false, false);
        null_end["endTime"] = nullptr;
        assert(!decode_job_record(null_end).end_time.has_value());

        auto no_error = status_payload(true, true);
        no_error.erase("error");
        no_error.erase("output");
        assert(decode_job_record(no_error).error.empty());
    }

    void test_transfer_stats()
    {
        const nlohmann::json stats = {
            {"bytes", 50},
            {"transferring",
             nlohmann::json::array({
                 {{"bytes", 50}, {"size", 200}, {"name", "a.bin"}, {"speed", 10.5}, {"speedAvg", 8.0}},
                 {{"bytes", 1}, {"size", 2}, {"name", "b.bin"}, {"speed", 1.0}, {"speedAvg", 1.0}},
             })},
        };
        const auto decoded = decode_transfer_stats(stats);
        assert(decoded.has_value());
        assert(decoded->name == "a.bin");
        assert(decoded->transferred_bytes == 50);
        assert(decoded->total_bytes == 200);
        assert(decoded->speed == 10.5);
        assert(decoded->average_speed == 8.0);
        assert(decoded->percentage() == 0.25);

        assert(!decode_transfer_stats(nlohmann::json{{"bytes", 0}}).has_value());
        assert(!decode_transfer_stats(nlohmann::json{{"transferring", nullptr}}).has_value());
        assert(!decode_transfer_stats(nlohmann::json{{"transferring", nlohmann::json::array()}}).has_value());

        const nlohmann::json unknown_size = {
            {"transferring",
             nlohmann::json::array({{{"bytes", 10}, {"size", -1}, {"name", "stream"}, {"speed", 0}, {"speedAvg", 0}}})},
        };
        const auto streaming = decode_transfer_stats(unknown_size);
        assert(streaming->total_bytes == 0);
        assert(error_of([&]
                        { (void)streaming->percentage(); }) == ErrorCode::DivisionUndefined);

        const nlohmann::json missing_speed = {{"transferring", nlohmann::json::array({{{"bytes", 1}, {"size", 2}, {"name", "x"}}})}};
        assert(error_of([&]
                        { decode_transfer_stats(missing_speed); }) == ErrorCode::MalformedPayload);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::StopNotAcknowledged) == "stop_not_acknowledged");
        assert(to_string(ErrorCode::TransientNetwork) == "transient_network");
        assert(error_code_from_int(to_int(ErrorCode::JobUnknown)) == ErrorCode::JobUnknown);

        const RcError error(ErrorCode::DivisionUndefined, "nothing to divide");
        assert(error.code() == ErrorCode::DivisionUndefined);
        assert(std::string(error.what()) == "nothing to divide");
    }

} // namespace

int main()
{
    try
    {
        test_endpoint_names();
        test_request_payloads();
        test_job_list_decoding();
        test_config_dump_remotes();
        test_daemon_error_body();
        test_timestamp_normalization();
        test_job_record_states();
        test_job_record_rejects_incomplete_payloads();
        test_transfer_stats();
        test_error_codes();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
