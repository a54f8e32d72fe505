#include "SdlApp.hpp"

#include <iostream>
#include <sstream>

#include "Config.hpp"

SdlApp::SdlApp(GameController& controllerIn, const UiLayout& layoutIn, const std::string& picturePathIn)
	: controller(controllerIn),
	  layout(layoutIn),
	  renderer(),
	  picturePath(picturePathIn),
	  window(nullptr),
	  sdlRenderer(nullptr),
	  picture(nullptr),
	  running(false),
	  sdlInitialized(false),
	  guessPending(false),
	  lastTicks(0),
	  shakeUntil(0),
	  flashUntil(0),
	  flashColor{0, 0, 0, 0},
	  statusMessage() {
}

SdlApp::~SdlApp() {
	shutdown();
}

void SdlApp::shutdown() {
	controller.removeListener(this);
	if (picture) {
		SDL_DestroyTexture(picture);
		picture = nullptr;
	}
	if (sdlRenderer) {
		SDL_DestroyRenderer(sdlRenderer);
		sdlRenderer = nullptr;
	}
	if (window) {
		SDL_DestroyWindow(window);
		window = nullptr;
	}
	if (sdlInitialized) {
		SDL_Quit();
		sdlInitialized = false;
	}
}

bool SdlApp::init() {
	if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
		std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
		return false;
	}
	sdlInitialized = true;
	window = SDL_CreateWindow("Picture Quiz", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
					 layout.windowWidth, layout.windowHeight, SDL_WINDOW_SHOWN);
	if (!window) {
		std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
		shutdown();
		return false;
	}
	sdlRenderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
	if (!sdlRenderer) {
		std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
		shutdown();
		return false;
	}
	if (!loadPicture()) {
		shutdown();
		return false;
	}
	controller.addListener(this);
	return true;
}

void SdlApp::run() {
	if (!init()) {
		return;
	}
	running = true;
	lastTicks = SDL_GetTicks();
	while (running) {
		SDL_Event event;
		while (SDL_PollEvent(&event)) {
			handleEvent(event);
		}
		Uint32 now = SDL_GetTicks();
		controller.tick(static_cast<int>(now - lastTicks));
		lastTicks = now;
		refreshLayout();
		updateTitle();
		render();
		SDL_Delay(Config::kFrameDelayMs);
	}
	shutdown();
}

void SdlApp::onCellRevealed(int cell) {
	statusMessage = "Cell " + std::to_string(cell + 1) + " revealed";
}

void SdlApp::onAnswerJudged(GameState::AnswerOutcome outcome, int) {
	Uint32 now = SDL_GetTicks();
	flashUntil = now + 400;
	if (outcome == GameState::AnswerOutcome::Correct) {
		flashColor = SDL_Color{60, 190, 110, 255};
		return;
	}
	flashColor = SDL_Color{230, 60, 60, 255};
	shakeUntil = now + 500;
	statusMessage = "Wrong answer";
}

void SdlApp::onTurnChanged(ScoreKeeper::TeamColor activeTeam) {
	statusMessage = std::string(teamName(activeTeam)) + " team's turn";
}

void SdlApp::onWon(const GameState::WinSummary& summary) {
	if (summary.scores.mode == ScoreKeeper::Mode::Team) {
		if (summary.scores.outcome == ScoreKeeper::Outcome::RedWins) {
			statusMessage = "Red team wins!";
		} else if (summary.scores.outcome == ScoreKeeper::Outcome::BlueWins) {
			statusMessage = "Blue team wins!";
		} else {
			statusMessage = "It's a tie!";
		}
	} else {
		std::ostringstream out;
		out << "Victory! " << summary.scores.soloScore << " points on " << summary.gridSize << "x" << summary.gridSize;
		statusMessage = out.str();
	}
	flashColor = SDL_Color{250, 190, 40, 255};
	flashUntil = SDL_GetTicks() + 1500;
}

void SdlApp::handleEvent(const SDL_Event& event) {
	if (event.type == SDL_QUIT) {
		running = false;
		return;
	}
	if (event.type == SDL_MOUSEBUTTONDOWN && event.button.button == SDL_BUTTON_LEFT) {
		handleClick(event.button.x, event.button.y);
		return;
	}
	if (event.type != SDL_KEYDOWN) {
		return;
	}
	SDL_Keycode key = event.key.keysym.sym;
	GameState::Phase phase = controller.session().currentState();
	if (phase == GameState::Phase::Setup) {
		handleSetupKey(key);
	} else if (phase == GameState::Phase::Won) {
		if (key == SDLK_RETURN || key == SDLK_ESCAPE || key == SDLK_SPACE) {
			controller.onReturnToSetup();
			statusMessage.clear();
		}
	} else {
		handlePlayKey(key);
	}
}

void SdlApp::handleSetupKey(SDL_Keycode key) {
	GameSettings settings = controller.pendingSettings();
	if (key == SDLK_RETURN || key == SDLK_SPACE) {
		report(controller.startGame());
		return;
	}
	if (key == SDLK_ESCAPE) {
		running = false;
		return;
	}
	if (key >= SDLK_2 && key <= SDLK_5) {
		settings.gridSize = static_cast<int>(key - SDLK_0);
	} else if (key == SDLK_m) {
		if (settings.mode == GameSettings::GameMode::Solo) {
			settings.mode = GameSettings::GameMode::Team;
		} else if (settings.mode == GameSettings::GameMode::Team) {
			settings.mode = GameSettings::GameMode::Speed;
			settings.timeLimitSeconds = Config::kSpeedTimeLimitSeconds;
		} else {
			settings.mode = GameSettings::GameMode::Solo;
			settings.timeLimitSeconds = Config::kDefaultTimeLimitSeconds;
		}
	} else if (key == SDLK_UP && settings.timeLimitSeconds < Config::kMaxTimeLimitSeconds) {
		++settings.timeLimitSeconds;
	} else if (key == SDLK_DOWN && settings.timeLimitSeconds > Config::kMinTimeLimitSeconds) {
		--settings.timeLimitSeconds;
	} else {
		return;
	}
	report(controller.updateSettings(settings));
}

void SdlApp::handlePlayKey(SDL_Keycode key) {
	if (key == SDLK_ESCAPE) {
		guessPending = false;
		controller.onReturnToSetup();
		statusMessage.clear();
		return;
	}
	if (guessPending) {
		guessPending = false;
		if (key == SDLK_y) {
			report(controller.onGuess());
		} else {
			statusMessage = "Guess cancelled";
		}
		return;
	}
	if (key == SDLK_g) {
		guessPending = true;
		statusMessage = "Guessed the picture? Press Y to win now, any other key to cancel";
		return;
	}
	if (key >= SDLK_1 && key <= SDLK_9) {
		report(controller.onOptionChosen(static_cast<int>(key - SDLK_1)));
	} else if (key >= SDLK_a && key <= SDLK_f) {
		report(controller.onOptionChosen(static_cast<int>(key - SDLK_a)));
	}
}

void SdlApp::handleClick(int px, int py) {
	GameState::Phase phase = controller.session().currentState();
	CoordinateMapper mapper(layout);
	const Question* question = controller.session().currentQuestion();
	int option = 0;
	if (phase == GameState::Phase::QuestionPending && question && mapper.pixelToOption(px, py, question->optionCount(), option)) {
		report(controller.onOptionChosen(option));
		return;
	}
	int x = 0;
	int y = 0;
	if (phase == GameState::Phase::Idle && mapper.pixelToCell(px, py, x, y)) {
		report(controller.onCellClicked(x, y));
	}
}

void SdlApp::render() {
	SDL_SetRenderDrawColor(sdlRenderer, 240, 246, 252, 255);
	SDL_RenderClear(sdlRenderer);
	Uint32 now = SDL_GetTicks();
	int shakeOffset = 0;
	if (now < shakeUntil) {
		shakeOffset = ((now / 40) % 2 == 0) ? 6 : -6;
	}
	renderer.render(sdlRenderer, controller.session(), layout, picture, shakeOffset);
	if (now < flashUntil) {
		SDL_SetRenderDrawColor(sdlRenderer, flashColor.r, flashColor.g, flashColor.b, flashColor.a);
		for (int i = 0; i < 6; ++i) {
			SDL_Rect frame = {layout.boardX - 4 - i, layout.boardY - 4 - i, layout.boardPixelSize + 8 + i * 2, layout.boardPixelSize + 8 + i * 2};
			SDL_RenderDrawRect(sdlRenderer, &frame);
		}
	}
	SDL_RenderPresent(sdlRenderer);
}

void SdlApp::updateTitle() {
	const GameSession& session = controller.session();
	std::ostringstream title;
	title << "Picture Quiz";
	GameState::Phase phase = session.currentState();
	if (phase == GameState::Phase::Setup) {
		const GameSettings& settings = controller.pendingSettings();
		title << " - " << modeName(settings.mode) << " " << settings.gridSize << "x" << settings.gridSize
		      << ", " << settings.timeLimitSeconds << "s, " << controller.questions().size() << " questions"
		      << " [2-5 size, M mode, Up/Down time, Enter start]";
	} else if (phase == GameState::Phase::Won) {
		title << " - " << statusMessage;
	} else {
		ScoreKeeper::Snapshot scores = session.scoreSnapshot();
		if (scores.mode == ScoreKeeper::Mode::Team) {
			title << " - Red " << scores.redScore << " : " << scores.blueScore << " Blue (" << teamName(scores.activeTeam) << " to play)";
		} else {
			title << " - Score " << scores.soloScore;
		}
		Grid grid = session.gridSnapshot();
		title << " - Opened " << grid.revealedCount() << "/" << grid.cellCount();
		const Question* question = session.currentQuestion();
		if (question && phase == GameState::Phase::QuestionPending) {
			title << " - " << session.remainingTime() << "s - " << question->text;
			for (int i = 0; i < question->optionCount(); ++i) {
				title << "  " << static_cast<char>('A' + i) << ") " << question->options[static_cast<size_t>(i)];
			}
		} else if (!statusMessage.empty()) {
			title << " - " << statusMessage;
		}
	}
	if (!session.lastMessage().empty()) {
		title << " - " << session.lastMessage();
	}
	SDL_SetWindowTitle(window, title.str().c_str());
}

void SdlApp::refreshLayout() {
	const GameSession& session = controller.session();
	int gridSize = session.gridSnapshot().getSize();
	if (gridSize == 0) {
		gridSize = controller.pendingSettings().gridSize;
	}
	if (gridSize != layout.gridSize) {
		layout.updateForWindow(layout.windowWidth, layout.windowHeight, gridSize);
	}
}

bool SdlApp::loadPicture() {
	SDL_Surface* surface = nullptr;
	if (!picturePath.empty()) {
		surface = SDL_LoadBMP(picturePath.c_str());
		if (!surface) {
			std::cout << "\033[33mCould not load " << picturePath << ": " << SDL_GetError() << ", using a generated picture\033[0m" << std::endl;
		}
	}
	if (!surface) {
		surface = makeGeneratedPicture();
	}
	if (!surface) {
		std::cerr << "Could not create picture surface: " << SDL_GetError() << std::endl;
		return false;
	}
	picture = SDL_CreateTextureFromSurface(sdlRenderer, surface);
	SDL_FreeSurface(surface);
	if (!picture) {
		std::cerr << "SDL_CreateTextureFromSurface failed: " << SDL_GetError() << std::endl;
		return false;
	}
	return true;
}

SDL_Surface* SdlApp::makeGeneratedPicture() const {
	const int size = 256;
	SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, size, size, 32, SDL_PIXELFORMAT_RGBA8888);
	if (!surface) {
		return nullptr;
	}
	if (SDL_LockSurface(surface) != 0) {
		SDL_FreeSurface(surface);
		return nullptr;
	}
	Uint8* row = static_cast<Uint8*>(surface->pixels);
	for (int y = 0; y < size; ++y) {
		Uint32* pixels = static_cast<Uint32*>(static_cast<void*>(row + y * surface->pitch));
		for (int x = 0; x < size; ++x) {
			int dx = x - size / 2;
			int dy = y - size / 3;
			bool sun = dx * dx + dy * dy < 900;
			bool hill = y > size * 2 / 3 - (x * (size - x)) / (size * 2);
			Uint8 r = static_cast<Uint8>(sun ? 250 : (hill ? 40 : 90 + y / 4));
			Uint8 g = static_cast<Uint8>(sun ? 200 : (hill ? 150 + x / 8 : 160 + y / 4));
			Uint8 b = static_cast<Uint8>(sun ? 60 : (hill ? 70 : 230));
			pixels[x] = SDL_MapRGBA(surface->format, r, g, b, 255);
		}
	}
	SDL_UnlockSurface(surface);
	return surface;
}

void SdlApp::report(GameError error) {
	if (error == GameError::None) {
		return;
	}
	if (isConfigError(error)) {
		statusMessage = std::string("Setup: ") + describeError(error);
		return;
	}
	statusMessage = describeError(error);
}
