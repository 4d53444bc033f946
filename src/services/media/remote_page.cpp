#include "castbridge/services/media/remote_page.hpp"

namespace castbridge::services {

const std::string& remote_page_html() {
    static const std::string page = R"html(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>castbridge remote</title>
<style>
  body { font-family: system-ui, sans-serif; margin: 0; padding: 1rem; background: #111; color: #eee; }
  h1 { font-size: 1.2rem; margin: 0 0 .5rem; }
  section { background: #1d1d1d; border-radius: 8px; padding: .8rem; margin-bottom: .8rem; }
  button, input[type=submit] { background: #2f6fed; color: #fff; border: 0; border-radius: 6px; padding: .6rem .9rem; margin: .2rem; font-size: 1rem; }
  button:disabled { background: #444; }
  input[type=url], input[type=text] { width: 100%; box-sizing: border-box; padding: .5rem; margin: .3rem 0; border-radius: 6px; border: 1px solid #333; background: #000; color: #eee; }
  progress { width: 100%; }
  #status { font-size: .9rem; color: #aaa; }
  #message { min-height: 1.2rem; }
  .error { color: #ff7b72; }
</style>
</head>
<body>
<h1 id="device">castbridge</h1>
<div id="status">Connecting...</div>

<section>
  <input type="file" id="file" accept="video/*,audio/*,image/*">
  <button id="upload">Send file</button>
  <progress id="progress" max="100" value="0" hidden></progress>
</section>

<section>
  <form id="url-form">
    <input type="url" id="url" placeholder="https://example.com/video.mp4" required>
    <input type="text" id="title" placeholder="Title (optional)">
    <input type="submit" value="Cast link">
  </form>
</section>

<section id="controls">
  <button data-action="play_pause">Play / Pause</button>
  <button data-action="stop">Stop</button>
  <button data-action="seek" data-value="-30">-30s</button>
  <button data-action="seek" data-value="30">+30s</button>
  <button data-action="volume" data-value="-10">Vol -</button>
  <button data-action="volume" data-value="10">Vol +</button>
  <button data-action="mute">Mute</button>
</section>

<div id="message"></div>

<script>
const $ = (id) => document.getElementById(id);
let state = { volume: 100 };

function show(text, isError) {
  const el = $("message");
  el.textContent = text;
  el.className = isError ? "error" : "";
}

async function reply(res) {
  let body = {};
  try { body = await res.json(); } catch (e) { body = {}; }
  if (!res.ok) { throw new Error(body.error || ("HTTP " + res.status)); }
  return body;
}

async function refresh() {
  try {
    const info = await reply(await fetch("/remote/info"));
    $("device").textContent = info.device ? info.device.name : "No device bound";
    const st = await reply(await fetch("/remote/status"));
    state = st;
    let line = st.status;
    if (st.title) { line += " - " + st.title; }
    if (st.duration) { line += " (" + Math.floor(st.position) + "/" + Math.floor(st.duration) + "s)"; }
    line += " vol " + st.volume + (st.muted ? " muted" : "");
    $("status").textContent = line;
  } catch (e) {
    $("status").textContent = e.message;
  }
}

$("upload").addEventListener("click", () => {
  const file = $("file").files[0];
  if (!file) { show("Choose a file first", true); return; }
  const xhr = new XMLHttpRequest();
  xhr.open("POST", "/remote/upload");
  xhr.setRequestHeader("X-Filename", encodeURIComponent(file.name));
  xhr.setRequestHeader("Content-Type", file.type || "application/octet-stream");
  $("progress").hidden = false;
  xhr.upload.onprogress = (ev) => {
    if (ev.lengthComputable) { $("progress").value = Math.round(ev.loaded * 100 / ev.total); }
  };
  xhr.onload = () => {
    $("progress").hidden = true;
    let body = {};
    try { body = JSON.parse(xhr.responseText); } catch (e) { body = {}; }
    if (xhr.status >= 200 && xhr.status < 300) { show("Casting " + (body.title || file.name)); }
    else { show(body.error || ("Upload failed: HTTP " + xhr.status), true); }
    refresh();
  };
  xhr.onerror = () => { $("progress").hidden = true; show("Upload failed", true); };
  xhr.send(file);
});

$("url-form").addEventListener("submit", async (ev) => {
  ev.preventDefault();
  try {
    const body = await reply(await fetch("/remote/url", {
      method: "POST",
      headers: { "Content-Type": "application/json" },
      body: JSON.stringify({ url: $("url").value, title: $("title").value })
    }));
    show("Casting " + (body.title || $("url").value));
  } catch (e) { show(e.message, true); }
  refresh();
});

document.querySelectorAll("#controls button").forEach((button) => {
  button.addEventListener("click", async () => {
    const action = button.dataset.action;
    const payload = { action: action };
    if (action === "seek") { payload.delta = Number(button.dataset.value); }
    if (action === "volume") { payload.level = Math.max(0, Math.min(100, (state.volume || 0) + Number(button.dataset.value))); }
    try {
      await reply(await fetch("/remote/control", {
        method: "POST",
        headers: { "Content-Type": "application/json" },
        body: JSON.stringify(payload)
      }));
      show("");
    } catch (e) { show(e.message, true); }
    refresh();
  });
});

refresh();
setInterval(refresh, 2000);
</script>
</body>
</html>
)html";
    return page;
}

} // namespace castbridge::services
