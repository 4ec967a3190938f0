#include "wxrx/debug.hpp"
#include "wxrx/io/sample_reader.hpp"
#include "wxrx/records.hpp"
#include "wxrx/rx/decoder.hpp"
#include "decode_args.hpp"

#include <cstdio>
#include <ctime>
#include <exception>
#include <iostream>
#include <vector>

// Command-line front-end: decodes ELV or Mebus sensor frames from a raw
// AM-demodulated sample stream, e.g.
//   rtl_fm -M -f 868.35M -s 160k | wxrx_decode --protocol elv -
//   rtl_fm -M -f 433.84M -s 160k | wxrx_decode --protocol mebus -
// Exit codes:
//   0 -> input consumed to the end
//   2 -> CLI/argument error or I/O error

namespace {

void print_time() {
    char buf[64];
    std::time_t now = std::time(nullptr);
    if (std::strftime(buf, sizeof(buf), "time: %x %X", std::localtime(&now)) > 0)
        std::cout << buf << '\n';
}

template <typename Record>
void print_records(const std::vector<Record> &records) {
    for (const auto &rec : records) {
        print_time();
        std::cout << wxrx::format_record(rec) << std::endl;
    }
}

template <typename Decoder>
void run(Decoder &decoder, wxrx::io::SampleReader &reader) {
    for (auto block = reader.next_block(); !block.empty(); block = reader.next_block())
        print_records(decoder.push_samples(block));
    print_records(decoder.flush());

    const auto &st = decoder.stats();
    WXRX_INFOF("samples=%llu syncs=%llu frames=%llu records=%llu clip_warnings=%llu",
               static_cast<unsigned long long>(st.samples), static_cast<unsigned long long>(st.syncs),
               static_cast<unsigned long long>(st.frames), static_cast<unsigned long long>(st.records),
               static_cast<unsigned long long>(st.clip_warnings));
}

} // namespace

int main(int argc, char **argv) {
    try {
        auto parsed = wxrx::tools::parse_args(argc, argv);
        if (parsed.help) {
            wxrx::tools::print_usage(argv[0]);
            return 0;
        }
        if (parsed.have_log) wxrx::debug::set_level(parsed.log_level);

        wxrx::io::SampleReader reader(parsed.input);
        if (parsed.protocol == "elv") {
            wxrx::ElvParams params;
            params.sample_rate_hz = parsed.sample_rate_hz;
            wxrx::rx::ElvDecoder decoder(params);
            run(decoder, reader);
        } else {
            wxrx::MebusParams params;
            params.noise_level = parsed.noise_level;
            params.jitter = parsed.jitter;
            params.auto_noise_level = parsed.auto_noise;
            wxrx::rx::MebusDecoder decoder(params);
            run(decoder, reader);
        }
        return 0;
    } catch (const std::exception &ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return 2;
    }
}
