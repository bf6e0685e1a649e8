#include "stream/file_handle.hpp"
#include "stream/upload_stream.hpp"
#include "utils/digest.hpp"
#include "utils/utils.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#ifdef UPLOADSTREAM_HAS_IO_URING
#include "stream/io_uring_file_handle.hpp"
#endif
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace uploadstream;
//---------------------------------------------------------------------------
/// Settings of the example
struct Settings {
    /// The input file
    string filePath;
    /// The output file, empty discards the data
    string output;
    /// The chunk size
    uint64_t chunkSize = stream::Config::defaultChunkSize;
    /// The bandwidth ceiling in bytes/s
    double maxSpeed = 0;
    /// Cancel after this many ms, 0 never cancels
    uint64_t cancelAfter = 0;
    /// Pause after every this many ms of active upload, 0 never pauses
    uint64_t pauseEvery = 0;
    /// The pause duration in ms
    uint64_t pauseFor = 1000;
    /// The digest
    utils::Digest::Algorithm digest = utils::Digest::Algorithm::None;
    /// Read with io_uring
    bool uring = false;
};
//---------------------------------------------------------------------------
/// Writes all bytes to the output descriptor
static void writeAll(int fd, const uint8_t* data, uint64_t length) {
    while (length) {
        auto res = ::write(fd, data, length);
        if (res < 0) {
            if (errno == EINTR)
                continue;
            throw runtime_error("Output write error! " + string(strerror(errno)));
        }
        data += res;
        length -= static_cast<uint64_t>(res);
    }
}
//---------------------------------------------------------------------------
static unique_ptr<stream::Handle> openInput(const Settings& settings) {
#ifdef UPLOADSTREAM_HAS_IO_URING
    if (settings.uring)
        return make_unique<stream::IOUringFileHandle>(settings.filePath);
#else
    if (settings.uring)
        cerr << "Built without io_uring support, falling back to read!" << endl;
#endif
    return make_unique<stream::FileHandle>(settings.filePath);
}
//---------------------------------------------------------------------------
static int run(const Settings& settings) {
    auto handle = openInput(settings);
    auto size = handle->size();

    uint64_t uploadedTotal = 0;
    auto onProgress = [&](uint64_t chunk) {
        uploadedTotal += chunk;
        cout << "\rUploaded: " << utils::formatBytes(uploadedTotal);
        if (size)
            cout << " / " << utils::formatBytes(*size);
        cout << flush;
    };

    stream::Config config{.chunkSize = settings.chunkSize, .maxSpeed = settings.maxSpeed, .digest = settings.digest};
    stream::UploadStream upload(stream::Source::stream(move(handle)), config, onProgress);

    int out = -1;
    if (!settings.output.empty()) {
        out = ::open(settings.output.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (out < 0)
            throw runtime_error("Output open error! " + settings.output + ": " + string(strerror(errno)));
    }

    // Cancel and pause from a second thread, the transfer loop runs here
    atomic<bool> uploading = true;
    thread control([&] {
        auto start = chrono::steady_clock::now();
        auto lastResume = start;
        while (uploading) {
            auto now = chrono::steady_clock::now();
            if (settings.cancelAfter && now - start >= chrono::milliseconds(settings.cancelAfter)) {
                try {
                    upload.cancel();
                } catch (const exception& e) {
                    // The upload is stopped even if closing the input failed
                    cerr << "\n" << e.what() << endl;
                }
                cout << "\nUpload cancelled after " << upload.uploaded() << " bytes" << endl;
                return;
            }
            if (settings.pauseEvery && now - lastResume >= chrono::milliseconds(settings.pauseEvery)) {
                cout << "\nPausing upload..." << endl;
                upload.pause();
                this_thread::sleep_for(chrono::milliseconds(settings.pauseFor));
                cout << "Resuming upload..." << endl;
                upload.resume();
                lastResume = chrono::steady_clock::now();
            }
            this_thread::sleep_for(chrono::milliseconds(10));
        }
    });

    auto start = chrono::steady_clock::now();
    vector<uint8_t> buffer(settings.chunkSize);
    try {
        uint64_t length;
        while ((length = upload.read(buffer)) > 0) {
            if (out >= 0)
                writeAll(out, buffer.data(), length);
        }
    } catch (...) {
        uploading = false;
        control.join();
        if (out >= 0)
            ::close(out);
        throw;
    }
    uploading = false;
    control.join();
    if (out >= 0 && ::close(out) < 0)
        cerr << "Output close error! " << strerror(errno) << endl;

    auto seconds = chrono::duration<double>(chrono::steady_clock::now() - start).count();
    cout << "\nUpload " << (upload.cancelled() ? "stopped" : "complete") << "! " << upload.uploaded() << " bytes in " << seconds << " seconds" << endl;
    if (settings.digest != utils::Digest::Algorithm::None && !upload.cancelled()) {
        auto digest = upload.digest();
        cout << utils::Digest::name(settings.digest) << ": " << utils::hexEncode(digest) << " (base64 " << utils::base64Encode(digest) << ")" << endl;
    }
    return upload.cancelled() ? 1 : 0;
}
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    string helpText = "UploadStreamExample file [OPTIONS]\n\n";
    helpText += "OPTIONS:\n";
    helpText += "-c chunkSize (default: 4096)\n";
    helpText += "-s maxSpeed in bytes/s (default: unlimited)\n";
    helpText += "-o output file (default: discard)\n";
    helpText += "-x cancel after ms\n";
    helpText += "-p pause every ms of active upload\n";
    helpText += "-w pause duration in ms (default: 1000)\n";
    helpText += "-d digest [none, md5, sha256]\n";
    helpText += "-u io_uring (default: 0)\n";

    if (argc < 2) {
        cerr << helpText << endl;
        return -1;
    }

    Settings settings;
    settings.filePath = argv[1];
    try {
        for (auto i = 2; i < argc; i++) {
            if ((i + 1) >= argc) {
                cerr << helpText << endl;
                return -1;
            }
            if (!strcmp(argv[i], "-c")) {
                settings.chunkSize = stoull(argv[++i]);
            } else if (!strcmp(argv[i], "-s")) {
                settings.maxSpeed = stod(argv[++i]);
            } else if (!strcmp(argv[i], "-o")) {
                settings.output = argv[++i];
            } else if (!strcmp(argv[i], "-x")) {
                settings.cancelAfter = stoull(argv[++i]);
            } else if (!strcmp(argv[i], "-p")) {
                settings.pauseEvery = stoull(argv[++i]);
            } else if (!strcmp(argv[i], "-w")) {
                settings.pauseFor = stoull(argv[++i]);
            } else if (!strcmp(argv[i], "-d")) {
                settings.digest = utils::Digest::parse(argv[++i]);
            } else if (!strcmp(argv[i], "-u")) {
                settings.uring = atoi(argv[++i]);
            } else {
                cerr << helpText << endl;
                return -1;
            }
        }
        return run(settings);
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return -1;
    }
}
//---------------------------------------------------------------------------
