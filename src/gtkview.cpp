// gtkview.cpp - Painel de Varredura
// Dispara o plano de varreduras e exibe a forma de onda rolante lida da
// memória compartilhada do gerador.

#include <fcntl.h>
#include <glibmm.h>
#include <gtkmm.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include "../include/Communication.hpp"
#include "../include/FifoSweepEngine.hpp"
#include "../include/GlibScheduler.hpp"
#include "../include/IStatusReporter.hpp"
#include "../include/SweepConfig.hpp"
#include "../include/SweepErrors.hpp"
#include "../include/SweepSequencer.hpp"

// Configuração da janela
const int WINDOW_WIDTH = 800;   // Largura da janela em pixels
const int WINDOW_HEIGHT = 400;  // Altura da área de desenho em pixels
const size_t MAX_DISPLAY_POINTS =
    800;  // Número máximo de amostras exibidas na tela
const int UI_UPDATE_INTERVAL_MS =
    30;  // Intervalo de atualização da interface (~33 fps)

// Agrupa os dados compartilhados entre a thread de leitura e a thread principal
struct ViewerContext {
  SharedBuffer* shmBuffer;  // nullptr se o gerador não estiver rodando
  std::mutex mutex;         // Protege sampleHistory e frequency
  std::deque<double> sampleHistory;  // Histórico de amostras para exibição
  double frequency = 0.0;            // Última frequência publicada (Hz)
  std::atomic<bool> running{true};   // Controle da thread de leitura
};

// Área de desenho customizada que renderiza a forma de onda
class WaveformCanvas : public Gtk::DrawingArea {
 public:
  WaveformCanvas() {
    set_content_width(WINDOW_WIDTH);
    set_content_height(WINDOW_HEIGHT);
    set_expand(true);
    set_draw_func(sigc::mem_fun(*this, &WaveformCanvas::onDraw));
  }

  // Chamado pela UI thread quando novas amostras estão disponíveis
  void updateSamples(const std::deque<double>& samples, double frequency) {
    m_samples = samples;
    m_frequency = frequency;
    queue_draw();  // Solicita redesenho do canvas
  }

 private:
  std::deque<double> m_samples;  // Cópia local das amostras para renderização
  double m_frequency = 0.0;

  // Função de desenho chamada pelo GTK quando o canvas precisa ser renderizado
  void onDraw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height) {
    // Fundo preto
    cr->set_source_rgb(0, 0, 0);
    cr->paint();

    // Se não há dados, exibe mensagem de espera
    if (m_samples.size() < 2) {
      cr->set_source_rgb(0, 1, 0);
      auto layout = create_pango_layout("Aguardando sinal...");
      layout->set_font_description(Pango::FontDescription("Monospace 12"));
      int tw, th;
      layout->get_pixel_size(tw, th);
      cr->move_to(static_cast<double>(width - tw) / 2,
                  static_cast<double>(height - th) / 2);
      layout->show_in_cairo_context(cr);
      return;
    }

    // Desenha grade de referência (linhas horizontais e verticais)
    cr->set_source_rgba(0, 0.5, 0, 0.2);  // Verde transparente
    cr->set_line_width(0.5);

    int centerY = height / 2;
    for (int i = -2; i <= 2; i += 2) {
      double y = centerY + i * (static_cast<double>(height) / 6);
      cr->move_to(20, y);
      cr->line_to(width - 20, y);
      cr->stroke();
    }
    for (int i = 0; i <= 4; i++) {
      double x = 20 + i * static_cast<double>(width - 40) / 4;
      cr->move_to(x, 20);
      cr->line_to(x, height - 20);
      cr->stroke();
    }

    // Forma de onda como um único caminho
    cr->set_source_rgb(0, 1, 0);  // Verde brilhante
    cr->set_line_width(2);

    size_t n = m_samples.size();
    double stepX = static_cast<double>(width - 40) / (n - 1);
    // MIX_PEAK ocupa a altura útil inteira
    double verticalScale = (height - 60) / 2.0 / MIX_PEAK;

    for (size_t i = 0; i < n; ++i) {
      double x = 20 + i * stepX;
      double y = std::clamp(centerY - m_samples[i] * verticalScale, 20.0,
                            static_cast<double>(height - 20));
      if (i == 0) {
        cr->move_to(x, y);
      } else {
        cr->line_to(x, y);
      }
    }
    cr->stroke();

    // Frequência atual no canto superior esquerdo
    if (m_frequency > 0.0) {
      char text[32];
      std::snprintf(text, sizeof(text), "%.1f Hz", m_frequency);
      auto layout = create_pango_layout(text);
      layout->set_font_description(Pango::FontDescription("Monospace 10"));
      cr->move_to(24, 24);
      layout->show_in_cairo_context(cr);
    }
  }
};

// Mostra o status do sequenciador no rótulo da janela.
class LabelStatusReporter : public IStatusReporter {
 public:
  explicit LabelStatusReporter(Gtk::Label& label) : m_label(label) {}

  void report(const std::string& status) override {
    g_info("status: %s", status.c_str());
    m_label.set_text(status);
  }

 private:
  Gtk::Label& m_label;
};

// Janela principal da aplicação
class PanelWindow : public Gtk::Window {
 public:
  PanelWindow(SharedBuffer* buffer, const SweepOptions& options)
      : m_box(Gtk::Orientation::VERTICAL, 6),
        m_buttons(Gtk::Orientation::HORIZONTAL, 6),
        m_runButton("Run Sweep"),
        m_cancelButton("Cancel"),
        m_status("Ready."),
        m_scheduler(options.sweep.frameInterval),
        m_reporter(m_status),
        m_sequencer(
            options.sweep,
            [this, fifoPath = options.fifoPath]() {
              return std::make_unique<FifoSweepEngine>(m_scheduler, fifoPath);
            },
            m_scheduler, m_reporter) {
    m_ctx.shmBuffer = buffer;

    set_title("Painel de Varredura de Frequência");
    set_default_size(WINDOW_WIDTH, WINDOW_HEIGHT + 60);

    m_box.set_margin(8);
    m_status.set_halign(Gtk::Align::START);
    m_buttons.append(m_runButton);
    m_buttons.append(m_cancelButton);
    m_buttons.append(m_status);
    m_box.append(m_buttons);
    m_box.append(m_canvas);
    set_child(m_box);

    m_runButton.signal_clicked().connect(
        sigc::mem_fun(*this, &PanelWindow::onRunClicked));
    m_cancelButton.signal_clicked().connect(
        sigc::mem_fun(*this, &PanelWindow::onCancelClicked));
    m_sequencer.setFinishedCallback(
        [this](SequencerState) { updateButtons(); });
    updateButtons();

    // Inicia thread que lê dados da memória compartilhada
    if (m_ctx.shmBuffer) {
      m_readerThread = std::thread(&PanelWindow::readerThreadFunc, this);
    }

    // Configura timer para atualizar a UI periodicamente
    m_uiTimer = Glib::signal_timeout().connect(
        sigc::mem_fun(*this, &PanelWindow::updateWaveform),
        UI_UPDATE_INTERVAL_MS);

    if (options.runOnce) {
      Glib::signal_idle().connect_once(
          sigc::mem_fun(*this, &PanelWindow::onRunClicked));
    }
  }

  ~PanelWindow() override {
    m_uiTimer.disconnect();
    m_ctx.running = false;  // Sinaliza para thread de leitura parar
    if (m_readerThread.joinable()) m_readerThread.join();
  }

 private:
  ViewerContext m_ctx;  // Contexto compartilhado com a thread
  Gtk::Box m_box;
  Gtk::Box m_buttons;
  Gtk::Button m_runButton;
  Gtk::Button m_cancelButton;
  Gtk::Label m_status;
  WaveformCanvas m_canvas;  // Área de desenho da onda

  GlibScheduler m_scheduler;
  LabelStatusReporter m_reporter;
  SweepSequencer m_sequencer;

  std::thread m_readerThread;  // Thread para leitura de dados
  sigc::connection m_uiTimer;

  void onRunClicked() {
    m_sequencer.trigger();
    updateButtons();
  }

  void onCancelClicked() {
    m_sequencer.cancel();
    updateButtons();
  }

  // "Run Sweep" só fica ativo entre planos
  void updateButtons() {
    bool busy = m_sequencer.isBusy();
    m_runButton.set_sensitive(!busy);
    m_cancelButton.set_sensitive(busy);
  }

  // Executa em thread separada: lê novos dados da memória compartilhada
  void readerThreadFunc() {
    int lastWritePos = -1;

    while (m_ctx.running) {
      int currentWrite = m_ctx.shmBuffer->writePos;

      // Verifica se há novos dados disponíveis
      if (lastWritePos != currentWrite && m_ctx.shmBuffer->newDataAvailable) {
        int readPos = m_ctx.shmBuffer->readPos;

        {
          std::lock_guard<std::mutex> lock(m_ctx.mutex);
          // Lê todas as amostras novas do buffer circular
          while (readPos != currentWrite) {
            double sample = m_ctx.shmBuffer->samples[readPos];
            readPos = (readPos + 1) % BUFFER_SIZE;

            // Adiciona ao histórico e mantém tamanho máximo
            m_ctx.sampleHistory.push_back(sample);
            if (m_ctx.sampleHistory.size() > MAX_DISPLAY_POINTS) {
              m_ctx.sampleHistory.pop_front();
            }
          }
          m_ctx.frequency = m_ctx.shmBuffer->currentFrequency;
        }

        // Atualiza posição de leitura e limpa flag de novo dado
        m_ctx.shmBuffer->readPos = readPos;
        m_ctx.shmBuffer->newDataAvailable = false;
        lastWritePos = currentWrite;
      }

      // Pequena pausa para evitar uso excessivo de CPU
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  }

  // Chamado pelo timer da UI: atualiza o canvas com novas amostras
  bool updateWaveform() {
    std::lock_guard<std::mutex> lock(m_ctx.mutex);
    m_canvas.updateSamples(m_ctx.sampleHistory, m_ctx.frequency);
    return true;  // Mantém o timer ativo
  }
};

// Mapeia o buffer do gerador; nullptr se ele ainda não foi criado.
static SharedBuffer* openSharedBuffer() {
  int shmFd = shm_open(SHARED_MEMORY_NAME, O_RDWR, 0666);
  if (shmFd < 0) {
    g_warning("shared memory %s not found: is the generator running?",
              SHARED_MEMORY_NAME);
    return nullptr;
  }

  void* mapped = mmap(nullptr, sizeof(SharedBuffer), PROT_READ | PROT_WRITE,
                      MAP_SHARED, shmFd, 0);
  close(shmFd);  // O mapeamento continua válido
  if (mapped == MAP_FAILED) {
    g_warning("failed to map shared memory %s", SHARED_MEMORY_NAME);
    return nullptr;
  }
  return static_cast<SharedBuffer*>(mapped);
}

int main(int argc, char* argv[]) {
  Glib::init();
  signal(SIGPIPE, SIG_IGN);

  SweepOptions options;
  try {
    options = parseSweepOptions(argc, argv, "- frequency sweep panel");
  } catch (const ConfigurationError& e) {
    std::cerr << "[PANEL] " << e.what() << std::endl;
    return 2;
  }
  if (options.verbose) Glib::setenv("G_MESSAGES_DEBUG", "all");

  SharedBuffer* buffer = openSharedBuffer();

  auto app = Gtk::Application::create("org.wavesweeper.panel");
  int status = app->make_window_and_run<PanelWindow>(argc, argv, buffer,
                                                     options);

  if (buffer) munmap(buffer, sizeof(SharedBuffer));
  return status;
}
