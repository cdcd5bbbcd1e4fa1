#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_opengl3.h"
#include <spdlog/spdlog.h>

#if __APPLE__
#  include <OpenGL/gl3.h>
#else
#  include <GL/gl.h>
#endif

#include <ctime>
#include <string>
#include <vector>

#include "csv.hpp"
#include "profile.hpp"
#include "report.hpp"
#include "scan.hpp"

// Close line for one instrument, with the support / low-threshold level and reference day
static void DrawCloseWithLevel(const BarSeries& bars, const Verdict& v, const Profile& profile,
                               float height_px = 300.0f)
{
    if (bars.empty()) { ImGui::TextDisabled("No data"); return; }

    // Only the trailing window the screen looked at, plus some context
    const int window = (profile.strategy == Strategy::SupportRetest) ? profile.support_window
                                                                     : profile.volume_period;
    const size_t first = bars.size() > (size_t)(window * 2) ? bars.size() - window * 2 : 0;
    const double level = (profile.strategy == Strategy::SupportRetest) ? v.support_price : v.low_threshold;

    // Canvas area
    ImVec2 p0 = ImGui::GetCursorScreenPos();
    float  w  = ImGui::GetContentRegionAvail().x;
    float  h  = height_px;
    ImVec2 p1 = ImVec2(p0.x + w, p0.y + h);

    auto* draw = ImGui::GetWindowDrawList();
    draw->AddRect(p0, p1, IM_COL32(180,180,180,255));

    double min_px = level, max_px = level;
    for (size_t i = first; i < bars.size(); ++i) {
        if (bars[i].close < min_px) min_px = bars[i].close;
        if (bars[i].close > max_px) max_px = bars[i].close;
    }
    if (max_px <= min_px) max_px = min_px + 1.0; // avoid div by zero

    const int N = (int)(bars.size() - first);
    const float x_step = (N > 1) ? (w / float(N - 1)) : 0.0f;
    auto y_of = [&](double px){ return p0.y + (float)(1.0 - ((px - min_px) / (max_px - min_px))) * h; };

    for (int i=1; i<N; ++i) {
        float x0 = p0.x + (i-1) * x_step;
        float x1 = p0.x + (i)   * x_step;
        draw->AddLine(ImVec2(x0, y_of(bars[first+i-1].close)), ImVec2(x1, y_of(bars[first+i].close)),
                      IM_COL32(200,200,255,255), 1.5f);
    }

    // Support / threshold level
    const float ly = y_of(level);
    draw->AddLine(ImVec2(p0.x, ly), ImVec2(p1.x, ly), IM_COL32(230,180,60,255), 1.0f);

    // Reference volume day
    const float R = 4.0f;
    if (v.ref_index >= first && v.ref_index < bars.size()) {
        float x = p0.x + (float)(v.ref_index - first) * x_step;
        float y = y_of(bars[v.ref_index].close);
        draw->AddCircleFilled(ImVec2(x,y), R, IM_COL32(40,200,90,255));
        draw->AddCircle(ImVec2(x,y), R, IM_COL32(10,150,60,255), 0, 1.5f);
    }

    // Legend
    draw->AddRectFilled(ImVec2(p1.x-150, p0.y+8), ImVec2(p1.x-10, p0.y+64), IM_COL32(0,0,0,120), 6.0f);
    draw->AddText(ImVec2(p1.x-140, p0.y+12), IM_COL32(200,200,255,255), "Close");
    draw->AddText(ImVec2(p1.x-140, p0.y+28), IM_COL32(230,180,60,255),
                  profile.strategy == Strategy::SupportRetest ? "Support" : "Low threshold");
    draw->AddCircleFilled(ImVec2(p1.x-136, p0.y+52), R, IM_COL32(40,200,90,255));
    draw->AddText(ImVec2(p1.x-126, p0.y+44), IM_COL32(230,230,230,255), "Max volume day");

    ImGui::Dummy(ImVec2(w, h + 6.0f));
}


int main() {
    // --- SDL + OpenGL init ---
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        spdlog::error("SDL_Init error: {}", SDL_GetError());
        return 1;
    }
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    SDL_Window* window = SDL_CreateWindow("Volscan Studio",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1200, 700, SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);
    if (!window) {
        spdlog::error("SDL_CreateWindow error: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    SDL_GLContext gl = SDL_GL_CreateContext(window);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplSDL2_InitForOpenGL(window, gl);
    ImGui_ImplOpenGL3_Init("#version 150");

    // --- Scan state ---
    static char data_dir[256]   = "stock_data";
    static char names_file[256] = "stock_names.csv";
    int profile_idx = 0;
    Profile profile = support_retest_profile();
    NameTable names;
    ScanReport report;
    std::string status;
    int selected = -1;
    BarSeries selected_bars;

    auto run = [&]() {
        std::string err, warn;
        const auto files = list_csv_files(data_dir, err);
        if (!err.empty()) { status = err; return; }
        if (files.empty()) { status = std::string("No CSV files found in ") + data_dir; return; }
        names = load_name_table(names_file, warn, err);
        if (!err.empty() && profile.names_required) { status = err; return; }
        report = run_scan(files, profile, names, default_worker_count());
        status = std::to_string(files.size()) + " files: " + std::to_string(report.matched) + " matched, "
               + std::to_string(report.errors) + " failed";
        selected = -1;
        selected_bars.clear();
    };

    bool running = true;
    while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            ImGui_ImplSDL2_ProcessEvent(&e);
            if (e.type == SDL_QUIT) running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        // Controls
        ImGui::Begin("Controls");
        ImGui::InputText("Data dir", data_dir, sizeof(data_dir));
        ImGui::InputText("Names file", names_file, sizeof(names_file));
        if (ImGui::Combo("Profile", &profile_idx, "support-retest\0deep-contraction\0")) {
            profile = profile_idx == 0 ? support_retest_profile() : deep_contraction_profile();
            report = ScanReport{};
            selected = -1;
        }

        float pmin = (float)profile.price_min, pmax = (float)profile.price_max;
        if (ImGui::SliderFloat("Price min", &pmin, 0.0f, 100.0f) && pmin <= pmax) profile.price_min = pmin;
        if (ImGui::SliderFloat("Price max", &pmax, 0.0f, 200.0f) && pmax >= pmin) profile.price_max = pmax;

        if (profile.strategy == Strategy::SupportRetest) {
            float prox = (float)profile.proximity_max * 100.0f, ratio = (float)profile.volume_ratio_max * 100.0f;
            if (ImGui::SliderFloat("Proximity (%)", &prox, 0.5f, 10.0f)) profile.proximity_max = prox / 100.0;
            if (ImGui::SliderFloat("Volume ratio (%)", &ratio, 5.0f, 100.0f)) profile.volume_ratio_max = ratio / 100.0;
            ImGui::SliderInt("Support window", &profile.support_window, 5, 60);
            ImGui::SliderInt("Top N", &profile.top_n, 1, 50);
        } else {
            float shrink = (float)profile.volume_shrink_ratio * 100.0f, low = (float)profile.price_low_range_ratio * 100.0f;
            if (ImGui::SliderFloat("Volume shrink (%)", &shrink, 0.5f, 20.0f)) profile.volume_shrink_ratio = shrink / 100.0;
            if (ImGui::SliderFloat("Low range (%)", &low, 0.5f, 20.0f)) profile.price_low_range_ratio = low / 100.0;
        }

        if (ImGui::Button("Run scan")) run();
        if (!status.empty()) ImGui::TextDisabled("%s", status.c_str());

        ImGui::Separator();
        if (ImGui::Button("Export CSV")) {
            std::string err;
            const std::string path = default_output_path(profile, ".", std::time(nullptr));
            if (write_results_csv(path, report.ranked, profile, err)) status = "Saved " + path;
            else status = err;
        }
        ImGui::SameLine();
        ImGui::TextDisabled("(writes under the current directory)");
        ImGui::End();

        // Results
        ImGui::Begin("Results");
        const auto cols = result_columns(profile);
        if (ImGui::BeginTable("ranked", (int)cols.size(), ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
            for (const auto& c : cols) ImGui::TableSetupColumn(c.c_str());
            ImGui::TableHeadersRow();
            for (int i = 0; i < (int)report.ranked.size(); ++i) {
                const Verdict& v = report.ranked[i];
                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                if (ImGui::Selectable(v.code.c_str(), selected == i, ImGuiSelectableFlags_SpanAllColumns)) {
                    selected = i;
                    selected_bars.clear();
                    for (const auto& entry : report.entries) {
                        if (entry.identity.code != v.code) continue;
                        std::string warn, err;
                        selected_bars = load_csv(entry.path, warn, err);
                        if (!err.empty()) { status = err; selected_bars.clear(); }
                        break;
                    }
                }
                if (profile.strategy == Strategy::SupportRetest) {
                    ImGui::TableNextColumn(); ImGui::Text("%.2f", v.latest_close);
                    ImGui::TableNextColumn(); ImGui::Text("%.2f", v.support_price);
                    ImGui::TableNextColumn(); ImGui::Text("%d", v.score);
                    ImGui::TableNextColumn(); ImGui::TextUnformatted(tier_label(v.tier));
                    ImGui::TableNextColumn(); ImGui::TextUnformatted(v.name.c_str());
                } else {
                    ImGui::TableNextColumn(); ImGui::TextUnformatted(v.name.c_str());
                    ImGui::TableNextColumn(); ImGui::Text("%.2f", v.latest_close);
                    ImGui::TableNextColumn(); ImGui::Text("%.0f", v.latest_volume);
                    ImGui::TableNextColumn(); ImGui::Text("%.0f", v.max_volume);
                    ImGui::TableNextColumn(); ImGui::Text("%.3f", v.low_threshold);
                }
            }
            ImGui::EndTable();
        }
        ImGui::End();

        // Price plot
        ImGui::Begin("Close (selected)");
        if (selected >= 0 && selected < (int)report.ranked.size())
            DrawCloseWithLevel(selected_bars, report.ranked[selected], profile, 300.0f);
        else
            ImGui::TextDisabled("Select a result row");
        ImGui::End();


        // Render
        ImGui::Render();
        int w, h; SDL_GetWindowSize(window, &w, &h);
        glViewport(0, 0, w, h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
