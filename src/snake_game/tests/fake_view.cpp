#include "fake_view.hpp"

namespace gsnake_test {

namespace {

FakeView g_fake;

ViewHandle_t fakeInit(const ViewConfig_t* config) {
  FakeView& v = fake();
  ++v.inits;
  if (v.fail_init || config == nullptr) {
    return nullptr;
  }
  v.width = config->width;
  v.height = config->height;
  v.fps = config->fps;
  v.title = config->title ? config->title : "";
  v.palette.clear();
  for (int i = 0; i < VIEW_COLOR_COUNT; ++i) {
    v.palette.emplace_back(config->palette[i] ? config->palette[i] : "");
  }
  return static_cast<ViewHandle_t>(&v);
}

ViewResult_t fakeConfigureZone(ViewHandle_t handle, const char* element_id,
                               int x, int y, int max_w, int max_h) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id) return VIEW_BAD_DATA;
  static_cast<FakeView*>(handle)->zones[element_id] =
      gsnake::layout::Rect{x, y, max_w, max_h};
  return VIEW_OK;
}

ViewResult_t fakeDrawElement(ViewHandle_t handle, const char* element_id,
                             const ElementData_t* data) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || !data) return VIEW_BAD_DATA;
  auto* v = static_cast<FakeView*>(handle);
  if (v->zones.find(element_id) == v->zones.end()) return VIEW_INVALID_ID;

  switch (data->type) {
    case ELEMENT_TEXT:
      v->last_text = data->content.text ? data->content.text : "";
      break;
    case ELEMENT_NUMBER:
      v->last_text = std::to_string(data->content.number);
      break;
    case ELEMENT_MATRIX:
      v->last_cells.assign(
          data->content.matrix.data,
          data->content.matrix.data +
              data->content.matrix.width * data->content.matrix.height);
      break;
    case ELEMENT_SPRITES:
      v->last_sprites.assign(data->content.sprites.data,
                             data->content.sprites.data + data->content.sprites.count);
      break;
  }
  return VIEW_OK;
}

ViewResult_t fakeRender(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  auto* v = static_cast<FakeView*>(handle);
  ++v->renders;
  return v->render_result;
}

ViewResult_t fakePollInput(ViewHandle_t handle, InputEvent_t* event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  auto* v = static_cast<FakeView*>(handle);
  ++v->polls;
  if (v->poll_result != VIEW_OK) return v->poll_result;
  if (v->script.empty()) return VIEW_NO_EVENT;

  const InputEvent_t next = v->script.front();
  v->script.pop_front();
  if (next.key_code == kNoEventMarker) return VIEW_NO_EVENT;
  *event = next;
  return VIEW_OK;
}

ViewResult_t fakeShutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  ++static_cast<FakeView*>(handle)->shutdowns;
  return VIEW_OK;
}

}  // namespace

void FakeView::pushKey(int key_code, int key_state) {
  InputEvent_t event{};
  event.key_code = key_code;
  event.key_state = key_state;
  script.push_back(event);
}

FakeView& fake() { return g_fake; }

void reset_fake() { g_fake = FakeView{}; }

const ViewInterface fake_view = {
    VIEW_INTERFACE_VERSION, fakeInit,       fakeConfigureZone, fakeDrawElement,
    fakeRender,             fakePollInput,  fakeShutdown,
};

}  // namespace gsnake_test
