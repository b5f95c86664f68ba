#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: platform_input.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Энэ файл нь ember-shading-lib-ийн platform модульд хамаарах нэг кадрын
            оролтын төлвийг тодорхойлно.
*/


namespace ember
{
    struct PlatformInputState
    {
        bool quit = false;
        bool next_light = false;
        bool prev_light = false;
        bool next_background = false;
        bool prev_background = false;
        bool cycle_debug_view = false;
        bool toggle_pause = false;
    };
}
