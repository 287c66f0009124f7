// Tests for the ready cue waveform

#include "cue_player.hpp"
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <algorithm>

using namespace talkpaste;

// Sign changes, ignoring exact zero samples
static int count_zero_crossings(const std::vector<int16_t>& samples) {
    int crossings = 0;
    int last_sign = 0;
    for (int16_t s : samples) {
        int sign = s > 0 ? 1 : (s < 0 ? -1 : 0);
        if (sign == 0) continue;
        if (last_sign != 0 && sign != last_sign) ++crossings;
        last_sign = sign;
    }
    return crossings;
}

void test_default_cue() {
    std::cout << "Testing 1 kHz, 200 ms cue at 16 kHz..." << std::endl;

    auto tone = CuePlayer::make_tone(1000, 200, 16000);
    assert(tone.size() == 3200);

    int peak = 0;
    for (int16_t s : tone) {
        peak = std::max(peak, std::abs(static_cast<int>(s)));
    }
    assert(peak <= static_cast<int>(0.3 * 32767) + 1);
    assert(peak > static_cast<int>(0.25 * 32767));

    // 200 cycles cross zero twice each
    int crossings = count_zero_crossings(tone);
    assert(crossings >= 395 && crossings <= 400);

    std::cout << "  PASS" << std::endl;
}

void test_fades() {
    std::cout << "Testing cue fades in and out..." << std::endl;

    auto tone = CuePlayer::make_tone(1000, 200, 16000);
    assert(tone.front() == 0);
    assert(tone.back() == 0);

    // Quiet at both ends relative to the body
    int head = 0;
    int tail = 0;
    for (size_t i = 0; i < 16; ++i) {
        head = std::max(head, std::abs(static_cast<int>(tone[i])));
        tail = std::max(tail, std::abs(static_cast<int>(tone[tone.size() - 1 - i])));
    }
    assert(head < 3000);
    assert(tail < 3000);

    std::cout << "  PASS" << std::endl;
}

void test_other_rates() {
    std::cout << "Testing tone length follows rate and duration..." << std::endl;

    assert(CuePlayer::make_tone(1000, 200, 48000).size() == 9600);
    assert(CuePlayer::make_tone(440, 50, 16000).size() == 800);
    assert(CuePlayer::make_tone(1000, 0, 16000).empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Cue Tone Test Suite ===" << std::endl << std::endl;

    test_default_cue();
    test_fades();
    test_other_rates();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
