#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sliceload/crypto.hpp"
#include "sliceload/encoding/base64.hpp"
#include "sliceload/error_codes.hpp"
#include "sliceload/file_meta.hpp"
#include "sliceload/framing.hpp"
#include "sliceload/protocol.hpp"

using namespace sliceload;
using namespace sliceload::protocol;

void run_server_component_tests();
void run_client_component_tests();
void run_end_to_end_tests();

namespace
{

    void test_request_roundtrip()
    {
        CreateSessionRequest create{
            .file_name = "video.mp4",
            .file_type = ".mp4",
            .file_size = 10 * 1024 * 1024,
            .chunk_size = 3 * 1024 * 1024,
            .prefix = "media/2024",
            .storage = StorageMode::Discrete,
        };
        RequestEnvelope envelope{};
        envelope.command = Command::CreateSession;
        envelope.payload = create;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "CREATE_SESSION");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::CreateSession);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_create = decoded.payload.get<CreateSessionRequest>();
        assert(decoded_create.storage == StorageMode::Discrete);
        assert(decoded_create.prefix == "media/2024");

        auto without_storage = nlohmann::json(create);
        without_storage.erase("storage");
        assert(!without_storage.get<CreateSessionRequest>().storage);
    }

    void test_response_roundtrip()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Continue;
        envelope.error = ErrorCode::Ok;
        envelope.payload = UploadSliceResponse{.slice_id = "3", .sha1 = "abcd", .complete = false};
        envelope.request_id = std::string("7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "CONTINUE");
        const auto decoded = json.get<ResponseEnvelope>();

        assert(decoded.kind == ResponseKind::Continue);
        assert(decoded.payload.get<UploadSliceResponse>().slice_id == "3");

        ResponseEnvelope error{};
        error.kind = ResponseKind::Error;
        error.error = ErrorCode::Conflict;
        error.message = "mismatch";
        const auto error_decoded = nlohmann::json(error).get<ResponseEnvelope>();
        assert(error_decoded.error == ErrorCode::Conflict);
        assert(error_decoded.message == "mismatch");
    }

    void test_malformed_requests()
    {
        bool threw = false;
        try
        {
            (void)nlohmann::json{{"cmd", "DELETE_EVERYTHING"}}.get<RequestEnvelope>();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)nlohmann::json{{"file_name", "a"}, {"file_type", ".a"}, {"file_size", -5}, {"chunk_size", 1024}}
                .get<CreateSessionRequest>();
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_error_code_statuses()
    {
        assert(http_status(ErrorCode::Ok) == 200);
        assert(http_status(ErrorCode::InvalidPayload) == 400);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::Conflict) == 422);
        assert(http_status(ErrorCode::InternalError) == 500);
        assert(error_code_from_int(to_int(ErrorCode::Timeout)) == ErrorCode::Timeout);
        assert(to_string(ErrorCode::Conflict) == "conflict");
    }

    void test_framing()
    {
        nlohmann::json message = {{"cmd", "PING"}, {"payload", nlohmann::json::object()}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);

        // A partial buffer is not a frame yet.
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame).first(frame.size() - 1)));

        const auto decoded = try_decode_frame(frame);
        assert(decoded.has_value());
        assert(decoded->message == message);
        assert(decoded->bytes_consumed == frame.size());

        const FrameHeader oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool threw = false;
        try
        {
            (void)decode_frame_length(oversized);
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_base64()
    {
        const std::string text = "slice payload";
        const auto bytes = std::as_bytes(std::span(text.data(), text.size()));
        const auto encoded = encoding::encode_base64(bytes);
        assert(encoded == "c2xpY2UgcGF5bG9hZA==");

        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(std::string(reinterpret_cast<const char *>(decoded->data()), decoded->size()) == text);

        assert(encoding::encode_base64({}).empty());
        assert(encoding::decode_base64("")->empty());
        assert(!encoding::decode_base64("not*base64"));
        assert(!encoding::decode_base64("QUJDR"));
    }

    void test_slice_math()
    {
        assert(expected_slice_count(10 * 1024 * 1024, 3 * 1024 * 1024) == 4);
        assert(expected_slice_count(4096, 1024) == 4);
        assert(expected_slice_count(4097, 1024) == 5);
        assert(expected_slice_count(1, 1024) == 1);

        const auto meta = make_pending_meta("abc", "f.bin", ".bin", 4097, 1024, "", StorageMode::Sparse, 0);
        assert(meta.slices.size() == 5);
        assert(slice_offset(meta, 4) == 4096);
        assert(slice_length(meta, 3) == 1024);
        assert(slice_length(meta, 4) == 1);
        assert(pending_slices(meta).size() == 5);
        assert(!all_slices_uploaded(meta));

        assert(parse_slice_id("12") == 12u);
        assert(!parse_slice_id("-1"));
        assert(!parse_slice_id(" 1"));
        assert(!parse_slice_id("1a"));
        assert(!parse_slice_id(""));
    }

    void test_slice_ordering_is_numeric()
    {
        auto meta = make_pending_meta("abc", "f.bin", ".bin", 12 * 1024, 1024, "", StorageMode::Discrete, 0);
        const auto indices = slice_indices(meta);
        assert(indices.size() == 12);
        for (std::size_t i = 0; i < indices.size(); ++i)
        {
            assert(indices[i] == i);
        }

        meta.slices["10"].status = SliceStatus::Uploaded;
        meta.slices["2"].status = SliceStatus::Uploaded;
        const auto pending = pending_slices(meta);
        assert(pending.size() == 10);
        assert(pending[1] == 1 && pending[2] == 3 && pending.back() == 11);
        assert(uploaded_slice_count(meta) == 2);
    }

    void test_file_meta_document()
    {
        auto meta = make_pending_meta("f00d", "report.pdf", ".pdf", 2048, 1024, "docs", StorageMode::Discrete, 1700000000);
        meta.slices["1"].status = SliceStatus::Uploaded;
        meta.slices["1"].sha1 = "beef";

        const auto json = nlohmann::json(meta);
        assert(json.at("storage") == "discrete");
        assert(json.at("slices").at("1").at("status") == 1);
        assert(json.at("slices").at("1").at("slice_id") == "1");
        assert(json.at("slices").at("1").at("sha1") == "beef");

        const auto decoded = json.get<FileMeta>();
        assert(decoded.file_id == "f00d");
        assert(decoded.prefix == "docs");
        assert(decoded.created_at == 1700000000);
        assert(decoded.storage == StorageMode::Discrete);
        assert(decoded.slices.at("1").status == SliceStatus::Uploaded);
        assert(decoded.slices.at("0").status == SliceStatus::Pending);
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);

        // BLAKE2b-256 of the empty input, not SHA-1 (da39a3ee...).
        assert(crypto::hash_bytes(std::span<const std::byte>{}) ==
               "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(chunk_hash == stream_hash);

        std::istringstream padded(std::string("xx\xDE\xAD\xBE\xEF", 6));
        assert(crypto::hash_range(padded, 2, 4) == chunk_hash);
        // The stream stays usable for another range after hitting EOF.
        assert(crypto::hash_range(padded, 2, 100) == chunk_hash);
        assert(crypto::hash_range(padded, 2, 4) == chunk_hash);

        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto file_path = temp_dir / "sliceload_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);

        const auto id = crypto::random_hex(16);
        assert(id.size() == 32);
        assert(id != crypto::random_hex(16));
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_response_roundtrip();
        test_malformed_requests();
        test_error_code_statuses();
        test_framing();
        test_base64();
        test_slice_math();
        test_slice_ordering_is_numeric();
        test_file_meta_document();
        test_crypto();
        run_server_component_tests();
        run_client_component_tests();
        run_end_to_end_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
