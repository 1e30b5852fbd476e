#ifndef COMMUNICATION_HPP
#define COMMUNICATION_HPP

#include <cstring>

#include "SweepTypes.hpp"

/**
 * @file Communication.hpp
 * @brief Define estruturas de comunicação entre processos (controle,
 * gerador e painel).
 *
 * Usa memória compartilhada POSIX para transferência de amostras e um FIFO
 * para passagem de comandos. Cada comando é um registro binário de tamanho
 * fixo, menor que PIPE_BUF, então a escrita no FIFO é atômica.
 */

// Constantes de configuração
constexpr int SAMPLE_RATE = 48000;     ///< Taxa de amostragem do gerador (Hz)
constexpr int FRAME_INTERVAL_MS = 20;  ///< Intervalo entre quadros (50 fps)
constexpr double VOICE_GAIN = 0.5;     ///< Ganho de um oscilador em varredura
constexpr double SILENCE_FADE_SECONDS = 0.1;  ///< Fade-out do silence
constexpr double MIX_PEAK =
    2 * VOICE_GAIN;  ///< Pico da soma das duas vozes (fade cruzado)
static_assert(MIX_PEAK <= 1.0, "a soma das vozes não pode saturar");

constexpr int BUFFER_SIZE =
    16384;  ///< Tamanho do buffer circular (potência de 2 para wrap)
const char* const FIFO_COMMAND =
    "/tmp/sweep_commands";  ///< Pipe nomeado para comandos
const char* const SHARED_MEMORY_NAME =
    "/sweep_buffer";  ///< Nome do objeto de memória compartilhada

// Tipos de comando enviados do controlador para o gerador
enum CommandType {
  CMD_NONE,      ///< Nenhum comando
  CMD_START,     ///< Iniciar geração
  CMD_STOP,      ///< Parar geração
  CMD_SWEEP,     ///< Iniciar varredura (oscillator, waveform, rampa)
  CMD_SET_FREQ,  ///< Ajustar frequência (value = frequência em Hz)
  CMD_SILENCE,   ///< Fade-out do oscilador
  CMD_QUIT       ///< Encerrar processo gerador
};

struct Command {
  CommandType type;           ///< Tipo do comando
  OscillatorKind oscillator;  ///< Oscilador alvo
  WaveformKind waveform;      ///< Forma de onda (CMD_SWEEP)
  double value;               ///< Parâmetro associado (CMD_SET_FREQ)
  double startFrequency;      ///< Rampa do CMD_SWEEP
  double endFrequency;
  double duration;  ///< Segundos; 0 = frequência enviada pelo host

  Command()
      : type(CMD_NONE),
        oscillator(OscillatorKind::Wavetable),
        waveform(WaveformKind::Sine),
        value(0.0),
        startFrequency(0.0),
        endFrequency(0.0),
        duration(0.0) {}
  Command(CommandType t, OscillatorKind osc = OscillatorKind::Wavetable,
          double v = 0.0)
      : Command() {
    type = t;
    oscillator = osc;
    value = v;
  }
};

/**
 * @struct SharedBuffer
 * @brief Buffer circular em memória compartilhada para transferência de
 * amostras.
 *
 * O gerador escreve amostras na posição writePos, o painel lê de readPos.
 * newDataAvailable indica que novos dados foram escritos após um quadro
 * completo.
 */
struct SharedBuffer {
  double samples[BUFFER_SIZE];  ///< Amostras no buffer circular
  int writePos;                 ///< Posição atual de escrita (produtor)
  int readPos;                  ///< Posição atual de leitura (consumidor)
  bool newDataAvailable;        ///< Sinaliza novo quadro disponível
  int totalProduced;            ///< Total de amostras produzidas (estatística)
  double currentFrequency;      ///< Frequência do oscilador audível (Hz)

  SharedBuffer()
      : writePos(0),
        readPos(0),
        newDataAvailable(false),
        totalProduced(0),
        currentFrequency(0.0) {
    memset(samples, 0, sizeof(samples));
  }
};

#endif  // COMMUNICATION_HPP
