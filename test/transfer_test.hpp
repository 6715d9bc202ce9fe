#include <cxxtest/TestSuite.h>

#include <cerrno>

#include "test_helpers.hpp"

using rat::FileKind;
using rat::StreamHandle;
using rat::TransferOptions;
using rat::TransferResult;
using rat::TransferStrategy;

class TransferSuite : public CxxTest::TestSuite {
public:
    void testConcatenationIsExact() {
        std::string parts[] = {
            binary_data(3000, 1),
            "",
            "plain text\nwith lines\n",
            binary_data(rat::kDefaultBufferSize * 2 + 17, 7)
        };
        TempFile out("exact_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        std::string expected;
        int index = 0;
        for (auto& part : parts) {
            TempFile in("exact_in_" + std::to_string(index++), part);
            TransferResult result = rat::transfer(StreamHandle::open(in.path), output);
            TS_ASSERT_EQUALS(result.bytes, part.size());
            expected += part;
        }
        TS_ASSERT(output.close());
        TS_ASSERT_EQUALS(out.read().size(), expected.size());
        TS_ASSERT(out.read() == expected);
    }

    void testRegularFilesUseBulkCopy() {
        std::string data = binary_data(512 * 1024);
        TempFile in("bulk_in", data);
        TempFile out("bulk_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        TransferResult result = rat::transfer(StreamHandle::open(in.path), output);
        TS_ASSERT_EQUALS(result.bytes, data.size());
        TS_ASSERT_DIFFERS(result.strategy, TransferStrategy::buffered);
        TS_ASSERT(out.read() == data);
    }

    void testBulkCopyDisabled() {
        std::string data = binary_data(200 * 1024);
        TempFile in("nobulk_in", data);
        TempFile out("nobulk_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        TransferOptions options;
        options.bulk_copy = false;
        TransferResult result = rat::transfer(StreamHandle::open(in.path), output, options);
        TS_ASSERT_EQUALS(result.strategy, TransferStrategy::buffered);
        TS_ASSERT_EQUALS(result.buffer_size, rat::default_buffer_size());
        TS_ASSERT_EQUALS(result.bytes, data.size());
        TS_ASSERT(out.read() == data);
    }

    void testAppendOutputFallsBackToBuffered() {
        // copy_file_range refuses O_APPEND outputs with EBADF
        std::string data = binary_data(70000, 3);
        TempFile in("append_in", data);
        TempFile out("append_out", "head:");
        StreamHandle output = StreamHandle::open(out.path, "a");
        TransferResult result = rat::transfer(StreamHandle::open(in.path), output);
        TS_ASSERT_EQUALS(result.strategy, TransferStrategy::bulk_then_buffered);
        TS_ASSERT_EQUALS(result.buffer_size, rat::default_buffer_size());
        TS_ASSERT_EQUALS(result.bytes, data.size());
        TS_ASSERT(out.read() == "head:" + data);
    }

    void testPartialWritesAreCompleted() {
        std::string data = binary_data(100003, 5);
        TempFile in("short_in", data);
        TempFile out("short_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        TransferOptions options;
        options.bulk_copy = false;
        options.write = write_at_most_7;
        g_partial_write_calls = 0;
        TransferResult result = rat::transfer(StreamHandle::open(in.path), output, options);
        TS_ASSERT_EQUALS(result.bytes, data.size());
        TS_ASSERT_LESS_THAN_EQUALS((int)(data.size() / 7), g_partial_write_calls);
        TS_ASSERT(out.read() == data);
    }

    void testPartialWritesFromPipe() {
        std::string data = binary_data(50000, 9);
        PipePair in = pipe_create();
        TempFile out("short_pipe_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        TransferOptions options;
        options.write = write_at_most_7;
        PipeFeeder feeder(in, data);
        TransferResult result = rat::transfer(StreamHandle::borrow(in.input, "-"), output, options);
        feeder.join();
        TS_ASSERT_EQUALS(result.strategy, TransferStrategy::buffered);
        TS_ASSERT_EQUALS(result.buffer_size, rat::kPipeBufferSize);
        TS_ASSERT(out.read() == data);
    }

    void testPipeToPipeTenMegabytes() {
        const std::size_t size = 10 * 1024 * 1024;
        std::string data = binary_data(size, 11);
        PipePair in = pipe_create();
        PipePair out = pipe_create();
        PipeFeeder feeder(in, data);
        PipeDrain drain(out);

        StreamHandle input = StreamHandle::borrow(in.input, "-");
        StreamHandle output = StreamHandle::borrow(out.output, "pipe");
        TS_ASSERT_EQUALS(input.kind(), FileKind::fifo);
        TS_ASSERT_EQUALS(output.kind(), FileKind::fifo);
        TransferResult result = rat::transfer(std::move(input), output);
        out.close_output();
        feeder.join();
        drain.join();

        TS_ASSERT_EQUALS(result.strategy, TransferStrategy::buffered);
        TS_ASSERT_EQUALS(result.buffer_size, 64u * 1024u);
        TS_ASSERT_EQUALS(result.bytes, size);
        TS_ASSERT_EQUALS(drain.data.size(), size);
        TS_ASSERT(drain.data == data);
    }

    void testSameFileIsRejected() {
        std::string data = "do not duplicate me\n";
        TempFile file("self", data);
        StreamHandle output = StreamHandle::open(file.path, "a");
        StreamHandle input = StreamHandle::open(file.path);
        rat::FileHandle handle = input.get();
        try {
            rat::transfer(std::move(input), output);
            TS_FAIL("expected SameFileError");
        } catch (rat::SameFileError& error) {
            TS_ASSERT_EQUALS(error.path, file.path);
            TS_ASSERT_EQUALS(std::string(error.what()), "input file is output file");
        }
        // closed on the error path too
        TS_ASSERT(!handle_is_open(handle));
        TS_ASSERT_EQUALS(file.read(), data);
    }

    void testEmptySameFileIsRejected() {
        TempFile file("self_empty");
        StreamHandle output = StreamHandle::open(file.path, "a");
        TS_ASSERT_THROWS(rat::transfer(StreamHandle::open(file.path), output),
            rat::SameFileError);
    }

    void testInputClosedAfterTransfer() {
        TempFile in("closed_in", "abc");
        TempFile out("closed_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        StreamHandle input = StreamHandle::open(in.path);
        rat::FileHandle handle = input.get();
        rat::transfer(std::move(input), output);
        TS_ASSERT(!handle_is_open(handle));
        TS_ASSERT(handle_is_open(output.get()));
    }

    void testDirectoryIsReadError() {
        TempFile out("dir_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        try {
            rat::transfer(StreamHandle::open("."), output);
            TS_FAIL("expected ReadError");
        } catch (rat::ReadError& error) {
            TS_ASSERT_EQUALS(error.errno_code, EISDIR);
            TS_ASSERT_EQUALS(error.path, ".");
        }
    }

    void testProcFileWithoutSize() {
        // procfs reports size 0, the read/write loop picks up what bulk copy can't
        TempFile out("proc_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        StreamHandle input = StreamHandle::open("/proc/self/status");
        TS_ASSERT_EQUALS(input.info().size, 0u);
        TransferResult result = rat::transfer(std::move(input), output);
        TS_ASSERT_LESS_THAN(0u, result.bytes);
        TS_ASSERT_DIFFERS(out.read().find("Name:"), std::string::npos);
    }

    void testCharDeviceInput() {
        TempFile out("devnull_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        TransferResult result = rat::transfer(StreamHandle::open("/dev/null"), output);
        TS_ASSERT_EQUALS(result.bytes, 0u);
        TS_ASSERT_EQUALS(result.strategy, TransferStrategy::buffered);
        TS_ASSERT_EQUALS(result.buffer_size, rat::default_buffer_size());
    }

    void testBufferSizeOverride() {
        std::string data = binary_data(10000);
        TempFile in("override_in", data);
        TempFile out("override_out");
        StreamHandle output = StreamHandle::open(out.path, "w");
        TransferOptions options;
        options.bulk_copy = false;
        options.buffer_size = 4096;
        TransferResult result = rat::transfer(StreamHandle::open(in.path), output, options);
        TS_ASSERT_EQUALS(result.buffer_size, 4096u);
        TS_ASSERT(out.read() == data);
    }

    void testWriteErrorOnClosedPipe() {
        IgnoreSigPipe ignore;
        TempFile in("epipe_in", binary_data(1000));
        PipePair out = pipe_create();
        out.close_input();
        StreamHandle output = StreamHandle::borrow(out.output, "pipe");
        try {
            rat::transfer(StreamHandle::open(in.path), output);
            TS_FAIL("expected WriteError");
        } catch (rat::WriteError& error) {
            TS_ASSERT_EQUALS(error.errno_code, EPIPE);
        }
    }

    void testBufferedCopyResumesAfterBulkCopy() {
        std::string data = binary_data(9000, 13);
        std::string appended = binary_data(500, 17);
        TempFile in("offset_in", data);
        TempFile out("offset_out");
        StreamHandle input = StreamHandle::open(in.path);
        StreamHandle output = StreamHandle::open(out.path, "w");
        char head[1000];
        TS_ASSERT_EQUALS(rat::file_read(input.get(), head, sizeof(head)), (ssize_t)sizeof(head));

        rat::BulkResult bulk = rat::copy_bulk(input, output);
        TS_ASSERT_EQUALS(bulk.status, rat::BulkStatus::complete);
        TS_ASSERT_EQUALS(bulk.copied, data.size() - sizeof(head));

        // the input grows after copy_file_range reached its end
        rat::UniqueFileHandle writer(rat::file_open(in.path.c_str(), "a"));
        TS_ASSERT(writer);
        TS_ASSERT_EQUALS(rat::file_write_all(writer.get(), appended.data(), appended.size()),
            (ssize_t)appended.size());

        std::uint64_t rest = rat::copy_buffered(input, output, 4096);
        TS_ASSERT_EQUALS(rest, appended.size());
        TS_ASSERT(out.read() == data.substr(sizeof(head)) + appended);
    }
};
