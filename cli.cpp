#include "cli.hpp"
#include "commands.hpp"
#include "errors.hpp"
#include <new>
#include <stdexcept>
#include <string>

using namespace std;


void showUsage(ostream& os) {
    os << "Usage : " << PROG_NAME << " <command> <args>\n";
    os << "  encode <file> <type> <message> [output]  hide message in a new chunk\n";
    os << "  decode <file> <type>                     print message of chunk\n";
    os << "  remove <file> <type>                     remove chunk from file\n";
    os << "  print <file>                             list chunks of file\n";
    os << "  type is 4 ASCII letters, e.g. RuSt\n";
}


int handleError(ostream& err) {
    try {
        throw;
    }
    catch (const FileError& e) {
        err << "Error: " << e.what() << "\n";
        return FILE_ERROR;
    }
    catch (const InvalidSignatureError& e) {
        err << "Error: " << e.what() << "\n";
        return SIGN_ERROR;
    }
    catch (const ChunkDecodeError& e) {
        err << "Error: " << e.what() << "\n";
        return CHUNK_ERROR;
    }
    catch (const ChunkNotFoundError& e) {
        err << "Error: " << e.what() << "\n";
        return NOT_FOUND_ERROR;
    }
    catch (const PngError& e) {
        // InvalidFormatError, InvalidUtf8Error
        err << "Error: " << e.what() << "\n";
        return FORMAT_ERROR;
    }
    catch (const length_error& e) {
        err << "Error: " << e.what() << "\n";
        return FORMAT_ERROR;
    }
    catch (const bad_alloc&) {
        err << "Error: out of memory\n";
        return MEM_ERROR;
    }
    catch (const exception& e) {
        err << "Error: " << e.what() << "\n";
        return OTHER_ERROR;
    }
}


int runCommand(int argc, const char* const argv[], ostream& out, ostream& err) {
    if (argc < 2) {
        showUsage(err);
        return ARG_ERROR;
    }

    string command = argv[1];
    if (command == "-h" || command == "--help") {
        showUsage(out);
        return 0;
    }

    try {
        if (command == "encode" && (argc == 5 || argc == 6)) {
            EncodeArgs args;
            args.filePath = argv[2];
            args.chunkType = argv[3];
            args.message = argv[4];
            if (argc == 6)
                args.outputPath = argv[5];
            encodeCommand(args, out);
        } else if (command == "decode" && argc == 4) {
            DecodeArgs args;
            args.filePath = argv[2];
            args.chunkType = argv[3];
            decodeCommand(args, out);
        } else if (command == "remove" && argc == 4) {
            RemoveArgs args;
            args.filePath = argv[2];
            args.chunkType = argv[3];
            removeCommand(args, out);
        } else if (command == "print" && argc == 3) {
            PrintArgs args;
            args.filePath = argv[2];
            printCommand(args, out);
        } else {
            err << "Error : bad command or arguments: " << command << "\n";
            showUsage(err);
            return ARG_ERROR;
        }
    }
    catch (const exception&) {
        return handleError(err);
    }

    return 0;
}
