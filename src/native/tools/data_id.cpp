/* Copyright (C) 2016 NooBaa */
#include <getopt.h>
#include <stdlib.h>

#include "../coding/data_id.h"

using namespace dataid;
using std::cerr;
using std::cout;
using std::endl;

static void
usage(const char* prog)
{
    cerr << "Usage: " << prog << " [-v level] [-c] [-s] <file>..." << endl
         << "  -v level  debug level" << endl
         << "  -c        print chunk count and sizes" << endl
         << "  -s        print sha256 of the file" << endl;
}

static void
print_result(const std::string& path, const DataIdResult& res, bool print_chunks, bool print_sha256)
{
    cout << res.id << "  " << path << endl;
    if (print_chunks) {
        cout << "  chunks " << res.chunks << " size " << res.size << endl;
        cout << "  sizes";
        for (int len : res.chunk_lengths) {
            cout << " " << len;
        }
        cout << endl;
    }
    if (print_sha256) {
        cout << "  sha256 " << res.sha256.hex() << endl;
    }
}

int
main(int argc, char* argv[])
{
    bool print_chunks = false;
    bool print_sha256 = false;
    int opt;

    while ((opt = getopt(argc, argv, "v:csh")) != -1) {
        switch (opt) {
        case 'v':
            dataid_debug_level = atoi(optarg);
            break;
        case 'c':
            print_chunks = true;
            break;
        case 's':
            print_sha256 = true;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 2;
        }
    }

    if (optind >= argc) {
        usage(argv[0]);
        return 2;
    }

    SplitterConfig config;
    config.calc_sha256 = print_sha256;

    int status = 0;
    for (int i = optind; i < argc; ++i) {
        const std::string path(argv[i]);
        try {
            std::unique_ptr<ByteSource> source(new FileSource(path));
            const DataIdResult res = data_id(std::move(source), config);
            print_result(path, res, print_chunks, print_sha256);
        } catch (const Exception& e) {
            cerr << e << endl;
            status = 1;
        }
    }

    return status;
}
