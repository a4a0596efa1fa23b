#include "errors.hpp"
#include "vbios_rom.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <argparse.hpp>

namespace {

const std::string CONFIRM_TEXT = "I agree to be careful";

const std::string WARNING_TEXT =
    "\n"
    "USE THIS SOFTWARE AT YOUR OWN DISCRETION. THIS SOFTWARE HAS *NOT* BEEN\n"
    "EXTENSIVELY TESTED AND MAY NOT WORK WITH YOUR GRAPHICS CARD.\n"
    "\n"
    "If you want to save the created vBIOS file, type the following phrase\n"
    "EXACTLY as it is written below:\n"
    "\n" + CONFIRM_TEXT + "\n";

std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw vbios::IOError("Could not open file: " + filename);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw vbios::IOError("Could not read file: " + filename);
    }
    return bytes;
}

void write_file(const std::string& filename, const std::vector<uint8_t>& bytes) {
    std::ofstream outfile(filename, std::ios::binary);
    if (!outfile.is_open()) {
        throw vbios::IOError("Could not open file for writing: " + filename);
    }
    outfile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!outfile) {
        throw vbios::IOError("Could not write file: " + filename);
    }
}

bool confirmed() {
    std::cout << WARNING_TEXT << "\n";
    std::cout << "Type here: ";
    std::string answer;
    std::getline(std::cin, answer);
    return answer == CONFIRM_TEXT;
}

} // namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("vbiosplice", "0.1.0", argparse::default_arguments::all);
    program.add_description("Convert a full NVIDIA vBIOS ROM into a form compatible for PCI passthrough.");

    program.add_argument("-i", "--input")
        .help("The full ROM to read")
        .required();

    program.add_argument("-o", "--output")
        .help("Path for saving the newly generated ROM")
        .required();

    program.add_argument("--ignore-sanity-check")
        .help("Don't halt if any of the sanity checks fails")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--disable-footer-strip")
        .help("Don't strip the footer from the vBIOS (Allows you to convert older gen GPUs)")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--skip-the-very-important-warning")
        .help("Skip the very important warning and save the ROM without asking for any input")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const std::string input = program.get<std::string>("--input");
    const std::string output = program.get<std::string>("--output");
    const bool ignore_sanity = program.get<bool>("--ignore-sanity-check");
    const bool disable_footer = program.get<bool>("--disable-footer-strip");

    try {
        std::cout << "Opening the ROM file...\n";
        vbios::VbiosRom rom(read_file(input));

        std::cout << "Scanning for ROM offsets...\n";
        rom.detectOffsets(!disable_footer);
        if (rom.variant()) {
            std::cout << "ROM footer for " << *rom.variant() << " found!\n";
        }
        std::cout << "Offsets found!\n";

        if (!disable_footer) {
            std::cout << "Running sanity checks...\n";
        }
        if (auto violation = rom.runSanityChecks(!ignore_sanity)) {
            std::cout << "Encountered error during sanity check: " << violation->what() << "\n";
            std::cout << "Ignoring...\n";
        } else if (!disable_footer) {
            std::cout << "No problems found.\n";
        }

        auto spliced = rom.splice();

        if (!program.get<bool>("--skip-the-very-important-warning") && !confirmed()) {
            std::cout << "Wrong answer, halting...\n";
            return 1;
        }

        std::cout << "Writing the edited ROM...\n";
        write_file(output, spliced);
        std::cout << "Done!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
