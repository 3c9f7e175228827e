#include "ui.h"
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_wgpu.h>

void UI::init(GpuContext& ctx) {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr;

    ImGui_ImplGlfw_InitForOther(ctx.window, true);

    ImGui_ImplWGPU_InitInfo initInfo = {};
    initInfo.Device = ctx.device;
    initInfo.RenderTargetFormat = ctx.surfaceFormat;
    initInfo.DepthStencilFormat = WGPUTextureFormat_Undefined;
    initInfo.NumFramesInFlight = 1;
    ImGui_ImplWGPU_Init(&initInfo);
}

void UI::beginFrame() {
    ImGui_ImplWGPU_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void UI::drawOverlay(const OverlayStats& stats) {
    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.5f);
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                             ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                             ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoMove;
    if (ImGui::Begin("zounds", nullptr, flags)) {
        ImGui::Text("%.1f fps", stats.fps);
        ImGui::Text("grid %u x %u", stats.grid.width, stats.grid.height);
        ImGui::Text("step %llu (%s)", (unsigned long long)stats.stepCount, phaseName(stats.phase));
        if (stats.deviceErrors > 0)
            ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "%u device errors", stats.deviceErrors);
    }
    ImGui::End();
}

void UI::endFrame(WGPURenderPassEncoder renderPass) {
    ImGui::Render();
    ImGui_ImplWGPU_RenderDrawData(ImGui::GetDrawData(), renderPass);
}

void UI::shutdown() {
    ImGui_ImplWGPU_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}
