#include "io/open.hpp"
#include "io/write_guard.hpp"
#include "utils/data_vector.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// Dominik Durner, 2022
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
blobstream::io::OpenOptions optionsFromEnvironment()
// Endpoint and credentials from the AWS_S3_* variables, the AWS defaults otherwise
{
    blobstream::io::OpenOptions options;
    if (auto endpoint = getenv("AWS_S3_ENDPOINT"))
        options.store.endpoint = endpoint;
    if (auto region = getenv("AWS_S3_REGION"))
        options.store.region = region;
    auto key = getenv("AWS_S3_ACCESS_KEY");
    auto secret = getenv("AWS_S3_SECRET_ACCESS_KEY");
    if (key && secret)
        options.store.credentials = blobstream::cloud::AWS::Secret{key, secret, ""};
    return options;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc < 2 || (argc == 3 && strcmp(argv[1], "-w")) || argc > 3) {
        cerr << "usage: " << argv[0] << " [-w] s3://bucket/key" << endl;
        cerr << "  prints the object, or uploads stdin with -w" << endl;
        return 1;
    }
    auto write = argc == 3;
    auto uri = argv[argc - 1];

    try {
        auto options = optionsFromEnvironment();
        if (write) {
            // Upload stdin in blocks, the guard aborts the upload on failure
            blobstream::io::WriteGuard<> writer(blobstream::io::openWriter(uri, blobstream::io::writeBinary, options));
            string block(1u << 20, '\0');
            while (cin.read(block.data(), static_cast<streamsize>(block.size())) || cin.gcount())
                writer->write(blobstream::utils::asBytes(string_view(block.data(), static_cast<size_t>(cin.gcount()))));
            writer.finish();
            cerr << "wrote " << writer->tell() << " bytes to " << uri << endl;
        } else {
            auto reader = blobstream::io::openReader(uri, blobstream::io::readBinary, options);
            while (true) {
                auto block = reader->read(1 << 20);
                if (block.empty())
                    break;
                cout.write(block.data(), static_cast<streamsize>(block.size()));
            }
            cout.flush();
        }
    } catch (const blobstream::Error& e) {
        cerr << "error (" << blobstream::Error::kindName(e.kind()) << "): " << e.what() << endl;
        return 1;
    }
    return 0;
}
//---------------------------------------------------------------------------
